#ifndef PCH_H
#define PCH_H

// --- C++ 标准库 ---
#include <iostream>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <map>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>
#include <chrono>
#include <memory>
#include <cctype>
#include <optional>
#include <variant>
#include <future>
#include <functional>

// --- 第三方库 ---
#include <nlohmann/json.hpp>
// ICU 头文件只在 GraphemeUtils.cpp 中使用，不放入PCH。

// --- 项目内常用头文件 ---
#include "common_types.h"

#endif //PCH_H
