/*
 * DomainSentry - Secure Web Gateway Categorization Engine
 * Copyright (C) 2026 DomainSentry Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
/*
 * ============================================================================
 * DomainSentry - PRECOMPILED HEADER
 * ============================================================================
 * Includes: Stable STL headers shared by every translation unit.
 * ============================================================================
 */

#ifndef PCH_H
#define PCH_H

#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <optional>
#include <variant>
#include <cstdint>
#include <algorithm>
#include <iterator>
#include <type_traits>

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <future>
#include <chrono>

#include <limits>
#include <filesystem>

#endif // PCH_H
