/**
 * @file   logger_public.h
 *
 * @section LICENSE
 *
 * The MIT License
 *
 * @copyright Copyright (c) 2024 TileDB, Inc.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 *
 * @section DESCRIPTION
 *
 * Makes the global logging helpers available to library and tool code.
 */

#ifndef SIMPLEVCF_LOGGER_PUBLIC_H
#define SIMPLEVCF_LOGGER_PUBLIC_H

#include "utils/logger.h"

namespace simplevcf {
namespace vcf {

using common::global_logger;
using common::LOG_DEBUG;
using common::LOG_DEBUG_ENABLED;
using common::LOG_FATAL;
using common::LOG_INFO;
using common::LOG_SET_FILE;
using common::LOG_SET_LEVEL;
using common::LOG_TRACE;
using common::LOG_WARN;
using common::Logger;

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_LOGGER_PUBLIC_H
