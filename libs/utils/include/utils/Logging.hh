// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#ifndef UTILS_LOGGING_HH
#define UTILS_LOGGING_HH

#include <memory>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/format.h>

namespace infocard::utils
{
  class Logging
  {
  public:
    static std::shared_ptr<spdlog::logger> create(std::string domain);
    static void setup_console(spdlog::level::level_enum level);
  };
} // namespace infocard::utils

template<>
struct fmt::formatter<std::error_code> : fmt::formatter<std::string>
{
  auto format(const std::error_code &e, format_context &ctx) const
  {
    return fmt::formatter<std::string>::format(std::string(e.category().name()) + ":" + std::to_string(e.value()) + " ("
                                                 + e.message() + ")",
                                               ctx);
  }
};

#endif // UTILS_LOGGING_HH
