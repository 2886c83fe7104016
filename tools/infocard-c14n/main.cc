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


#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>
#include <spdlog/spdlog.h>

#include "infocard/ExclusiveC14NTransform.hh"
#include "infocard/ReferenceValidator.hh"
#include "utils/Base64.hh"
#include "utils/Logging.hh"

namespace
{
  constexpr int EXIT_CAPABILITY_UNAVAILABLE = 2;

  struct Arguments
  {
    bool verify{false};
    bool verbose{false};
    std::vector<std::string> prefixes;
    std::vector<std::string> files;
  };

  void usage(char const *const arg0, std::ostream &out)
  {
    out << "Usage:\n"
           "\n"
           "    "
        << arg0
        << " [--prefixes \"<p1 p2 ...>\"] [--verbose] [<XML input file> [<XML output file>]]\n"
           "    "
        << arg0
        << " --verify [--verbose] [<XML input file>]\n"
           "\n"
           "Canonicalises <XML input file> using Exclusive XML Canonicalization\n"
           "without comments [1]. Prefixes passed with --prefixes are treated as an\n"
           "InclusiveNamespaces PrefixList; use #default for the default namespace.\n"
           "\n"
           "The result is written to <XML output file>. If <XML output file> is not\n"
           "provided, the result is printed to the standard output. If <XML input\n"
           "file> is also not provided, it's read from the standard input.\n"
           "\n"
           "With --verify the input is an enveloped XML Signature [2]. Every\n"
           "Reference digest is checked and the canonical SignedInfo is printed.\n"
           "\n"
           "Exit status is 1 on error and 2 when XML canonicalization is not\n"
           "available on this system.\n"
           "\n"
           "[1] http://www.w3.org/TR/xml-exc-c14n\n"
           "[2] http://www.w3.org/TR/xmldsig-core\n"
        << std::endl;
  }

  bool help_requested(const std::string &arg)
  {
    return arg == "-h" || arg == "-help" || arg == "--help";
  }

  std::optional<Arguments> parse_arguments(int argc, char *argv[])
  {
    Arguments args;
    for (int i = 1; i < argc; i++)
      {
        std::string arg = argv[i];
        if (arg == "--verify")
          {
            args.verify = true;
          }
        else if (arg == "--verbose")
          {
            args.verbose = true;
          }
        else if (arg == "--prefixes")
          {
            if (++i >= argc)
              {
                return {};
              }
            std::string list = boost::algorithm::trim_copy(std::string(argv[i]));
            if (!list.empty())
              {
                boost::algorithm::split(args.prefixes, list, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
              }
          }
        else if (arg.size() > 1 && arg.front() == '-')
          {
            return {};
          }
        else
          {
            args.files.push_back(arg);
          }
      }

    const std::size_t max_files = args.verify ? 1 : 2;
    if (args.files.size() > max_files || (args.verify && !args.prefixes.empty()))
      {
        return {};
      }
    return args;
  }

  std::string read_input(const std::vector<std::string> &files)
  {
    if (files.empty() || files[0] == "-")
      {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
      }

    const std::string &filename = files[0];
    if (std::filesystem::file_size(filename) == 0)
      {
        return {};
      }

    auto mode = boost::interprocess::read_only;
    boost::interprocess::file_mapping fm(filename.c_str(), mode);
    boost::interprocess::mapped_region region(fm, mode, 0, 0);
    return std::string(static_cast<const char *>(region.get_address()), region.get_size());
  }

  void write_output(const std::vector<std::string> &files, const std::string &data)
  {
    if (files.size() < 2 || files[1] == "-")
      {
        std::cout << data << std::flush;
        return;
      }

    std::ofstream out(files[1], std::ios::binary | std::ios::trunc);
    out << data;
    if (!out)
      {
        throw std::runtime_error("Cannot write file '" + files[1] + "'");
      }
  }

  int report(const std::error_code &ec)
  {
    std::cerr << "Error: " << ec.message() << '\n';
    return ec == infocard::TransformErrc::CapabilityUnavailable ? EXIT_CAPABILITY_UNAVAILABLE : EXIT_FAILURE;
  }

  int canonicalize(const Arguments &args, const std::string &xml)
  {
    infocard::ExclusiveC14NTransform c14n(args.prefixes);
    auto result = c14n.canonicalize(xml);
    if (!result)
      {
        return report(result.error());
      }
    write_output(args.files, result.value());
    return EXIT_SUCCESS;
  }

  int verify(const std::string &xml)
  {
    infocard::ReferenceValidator validator;
    auto result = validator.validate(xml);
    if (!result)
      {
        return report(result.error());
      }

    for (const auto &reference: result.value().references)
      {
        std::cout << (reference.uri.empty() ? "\"\"" : reference.uri) << ' ' << reference.digest_method << " OK "
                  << infocard::utils::Base64::encode(reference.computed_digest) << '\n';
      }
    std::cout << result.value().canonical_signed_info << std::endl;
    return EXIT_SUCCESS;
  }
} // namespace

int
main(int argc, char *argv[])
{
  if (argc == 2 && help_requested(argv[1]))
    {
      usage(argv[0], std::cout);
      return EXIT_SUCCESS;
    }

  auto args = parse_arguments(argc, argv);
  if (!args)
    {
      usage(argv[0], std::cerr);
      return EXIT_FAILURE;
    }

  infocard::utils::Logging::setup_console(args->verbose ? spdlog::level::debug : spdlog::level::warn);

  try
    {
      const std::string xml = read_input(args->files);
      return args->verify ? verify(xml) : canonicalize(*args, xml);
    }
  catch (const boost::interprocess::interprocess_exception &e)
    {
      std::cerr << "Error: cannot read input: " << e.what() << '\n';
    }
  catch (const std::exception &e)
    {
      std::cerr << "Error: " << e.what() << '\n';
    }
  return EXIT_FAILURE;
}
