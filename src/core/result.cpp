/**
 * @file        core/result.cpp
 * @brief       Result / error helpers
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <gdx/result.h>

namespace gdx {

const char* ErrorCategoryName(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::IO:
        return "io";
    case ErrorCategory::Parse:
        return "parse";
    case ErrorCategory::Validation:
        return "validation";
    case ErrorCategory::Internal:
        return "internal";
    }
    return "unknown";
}

}  // namespace gdx
