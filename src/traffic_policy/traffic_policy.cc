/** @file

  traffic_policy: run an edge policy against a response body or a synthetic request.

  @section license License

  Licensed to the Apache Software Foundation (ASF) under one
  or more contributor license agreements.  See the NOTICE file
  distributed with this work for additional information
  regarding copyright ownership.  The ASF licenses this file
  to you under the Apache License, Version 2.0 (the
  "License"); you may not use this file except in compliance
  with the License.  You may obtain a copy of the License at

      http://www.apache.org/licenses/LICENSE-2.0

  Unless required by applicable law or agreed to in writing, software
  distributed under the License is distributed on an "AS IS" BASIS,
  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
  See the License for the specific language governing permissions and
  limitations under the License.
 */

#include <getopt.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "swoc/TextView.h"
#include "swoc/swoc_file.h"
#include "swoc/bwf_base.h"

#include "edge_policy/Errata.h"
#include "edge_policy/RedactionPolicy.h"
#include "edge_policy/RoutingPolicy.h"
#include "edge_policy/Diags.h"

using namespace edge_policy;
using namespace swoc::literals;

namespace
{
constexpr int EXIT_USAGE  = 1;
constexpr int EXIT_CONFIG = 2;

// Body is fed to the stream in chunks of this size, like a proxy would.
constexpr size_t CHUNK_SIZE = 16 * 1024;

DbgCtl dbg_ctl{"traffic_policy"};

void
usage(FILE *out)
{
  fprintf(out, "Usage: traffic_policy redact --config FILE [--path PATH] [--content-type TYPE] [--debug TAGS] [BODY_FILE]\n"
               "       traffic_policy route --config FILE [--path PATH] [--query QUERY] [--header 'Name: value']... [--debug TAGS]\n"
               "\n"
               "  redact  Scan a response body (BODY_FILE, or stdin) and print the annotations and the result.\n"
               "  route   Evaluate a request and print the routing decision.\n"
               "\n"
               "Exit status is 0 on success, 1 on usage errors and 2 if the configuration is invalid.\n");
}

void
enable_debug(char const *tags)
{
  diags()->set_level(DL_Debug);
  diags()->set_tags(tags);
}

void
print_fields(HeaderList const &fields, char const *prefix = "")
{
  for (auto const &[name, value] : fields) {
    printf("%s%s: %s\n", prefix, name.c_str(), value.c_str());
  }
}

bool
read_body(char const *file, std::string &body)
{
  if (file == nullptr || 0 == strcmp(file, "-")) {
    body.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }

  std::error_code ec;
  body = swoc::file::load(swoc::file::path{file}, ec);
  if (ec) {
    std::string msg;
    swoc::bwprint(msg, "unable to read body from '{}': {}", file, ec.message());
    Error("%s", msg.c_str());
    return false;
  }
  return true;
}

int
run_redact(int argc, char *argv[])
{
  static const struct option longopt[] = {
    {const_cast<char *>("config"),       required_argument, nullptr, 'c' },
    {const_cast<char *>("path"),         required_argument, nullptr, 'p' },
    {const_cast<char *>("content-type"), required_argument, nullptr, 't' },
    {const_cast<char *>("debug"),        required_argument, nullptr, 'd' },
    {const_cast<char *>("help"),         no_argument,       nullptr, 'h' },
    {nullptr,                            no_argument,       nullptr, '\0'}
  };

  char const *config_file  = nullptr;
  char const *path         = "/";
  char const *content_type = "";
  char const *debug_tags   = nullptr;

  while (true) {
    int opt = getopt_long(argc, argv, "c:p:t:d:h", longopt, nullptr);

    if (opt == -1) {
      break;
    }

    switch (opt) {
    case 'c':
      config_file = optarg;
      break;
    case 'p':
      path = optarg;
      break;
    case 't':
      content_type = optarg;
      break;
    case 'd':
      debug_tags = optarg;
      break;
    case 'h':
      usage(stdout);
      return EXIT_SUCCESS;
    default:
      usage(stderr);
      return EXIT_USAGE;
    }
  }

  if (config_file == nullptr || argc - optind > 1) {
    usage(stderr);
    return EXIT_USAGE;
  }

  auto rv = RedactionPolicy::load_file(swoc::file::path{config_file});
  if (!rv.is_ok()) {
    log_errata(rv.errata(), "redact");
    return EXIT_CONFIG;
  }
  auto policy = rv.result();

  diags()->set_level(policy->config().log_level);
  if (debug_tags != nullptr) {
    enable_debug(debug_tags);
  }

  std::string body;
  if (!read_body(optind < argc ? argv[optind] : nullptr, body)) {
    return EXIT_USAGE;
  }

  auto status = policy->classify(swoc::TextView{path, strlen(path)}, swoc::TextView{content_type, strlen(content_type)}, body.size());
  RedactionStream stream(policy, status);
  std::string     output;
  swoc::TextView  remaining{body};
  do {
    auto chunk = remaining.prefix(CHUNK_SIZE);
    remaining.remove_prefix(chunk.size());
    output.append(stream.write(chunk, remaining.empty()));
  } while (!remaining.empty());

  Dbg(dbg_ctl, "%zu bytes in, %zu bytes out", body.size(), output.size());

  print_fields(response_annotations(stream.result()));
  printf("\n");
  fwrite(output.data(), 1, output.size(), stdout);
  return EXIT_SUCCESS;
}

int
run_route(int argc, char *argv[])
{
  static const struct option longopt[] = {
    {const_cast<char *>("config"), required_argument, nullptr, 'c' },
    {const_cast<char *>("path"),   required_argument, nullptr, 'p' },
    {const_cast<char *>("query"),  required_argument, nullptr, 'q' },
    {const_cast<char *>("header"), required_argument, nullptr, 'H' },
    {const_cast<char *>("debug"),  required_argument, nullptr, 'd' },
    {const_cast<char *>("help"),   no_argument,       nullptr, 'h' },
    {nullptr,                      no_argument,       nullptr, '\0'}
  };

  char const              *config_file = nullptr;
  char const              *debug_tags  = nullptr;
  char const              *query       = nullptr;
  char const              *target      = "/";
  std::vector<char const *> headers;

  while (true) {
    int opt = getopt_long(argc, argv, "c:p:q:H:d:h", longopt, nullptr);

    if (opt == -1) {
      break;
    }

    switch (opt) {
    case 'c':
      config_file = optarg;
      break;
    case 'p':
      target = optarg;
      break;
    case 'q':
      query = optarg;
      break;
    case 'H':
      headers.push_back(optarg);
      break;
    case 'd':
      debug_tags = optarg;
      break;
    case 'h':
      usage(stdout);
      return EXIT_SUCCESS;
    default:
      usage(stderr);
      return EXIT_USAGE;
    }
  }

  if (config_file == nullptr || optind != argc) {
    usage(stderr);
    return EXIT_USAGE;
  }

  // A path given as "/p?q" carries its own query, --query overrides it.
  RequestAttributes request{swoc::TextView{target, strlen(target)}};
  if (query != nullptr) {
    request.set_query(swoc::TextView{query, strlen(query)});
  }
  for (auto line : headers) {
    if (!request.add_header_line(swoc::TextView{line, strlen(line)})) {
      fprintf(stderr, "traffic_policy: invalid header '%s', expected 'Name: value'\n", line);
      return EXIT_USAGE;
    }
  }

  auto rv = RoutingPolicy::load_file(swoc::file::path{config_file});
  if (!rv.is_ok()) {
    log_errata(rv.errata(), "route");
    return EXIT_CONFIG;
  }
  auto policy = rv.result();

  diags()->set_level(policy->config().log_level);
  if (debug_tags != nullptr) {
    enable_debug(debug_tags);
  }

  auto decision = policy->decide(request);

  printf("target: %s\n", decision.target.c_str());
  printf("matched_rule: %s\n", decision.matched_rule ? decision.matched_rule->c_str() : "(none)");
  if (decision.rewritten_path) {
    printf("rewritten_path: %s\n", decision.rewritten_path->c_str());
  }
  print_fields(decision.request_headers(), "add ");
  for (auto const &name : decision.remove_headers) {
    printf("remove %s\n", name.c_str());
  }
  return EXIT_SUCCESS;
}

} // namespace

int
main(int argc, char *argv[])
{
  if (argc < 2) {
    usage(stderr);
    return EXIT_USAGE;
  }

  swoc::TextView command{argv[1], strlen(argv[1])};

  // Sub-command options start after the command name.
  optind = 1;
  if (command == "redact"_tv) {
    return run_redact(argc - 1, argv + 1);
  } else if (command == "route"_tv) {
    return run_route(argc - 1, argv + 1);
  } else if (command == "help"_tv || command == "--help"_tv || command == "-h"_tv) {
    usage(stdout);
    return EXIT_SUCCESS;
  }

  fprintf(stderr, "traffic_policy: unknown command '%s'\n", argv[1]);
  usage(stderr);
  return EXIT_USAGE;
}
