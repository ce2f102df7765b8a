#pragma once

// Standard C++ Library - Most frequently used
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <functional>
#include <algorithm>
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <regex>
#include <stdexcept>

// Additional commonly used headers
#include <cctype>

// Core types - used by almost every file
#include "common/project_types.hpp"
