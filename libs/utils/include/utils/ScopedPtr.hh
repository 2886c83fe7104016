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

#ifndef UTILS_SCOPED_PTR_HH
#define UTILS_SCOPED_PTR_HH

#include <functional>
#include <memory>

namespace infocard::utils
{
  /*
   * Owning pointer for C library handles without spelling out the
   * deleter type.
   */
  template<class T>
  using scoped_ptr = std::unique_ptr<T, std::function<void(T *const)>>;

  /*
   * Wrap a raw handle and its release function into a std::unique_ptr.
   * Intended to be used with `auto'.
   */
  template<class T, class D = std::default_delete<T>>
  constexpr std::unique_ptr<T, D>
  make_scoped(T *const ptr, D deleter = D())
  {
    return std::unique_ptr<T, D>(ptr, deleter);
  }
} // namespace infocard::utils

#endif // UTILS_SCOPED_PTR_HH
