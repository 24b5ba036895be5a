/*
 * Copyright (C) 2025 Agtonomy
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 */

#ifndef TSINK_TOOLS_TSINK_CLI_COMMAND_HANDLERS_HPP
#define TSINK_TOOLS_TSINK_CLI_COMMAND_HANDLERS_HPP

#include <functional>
#include <iostream>
#include <map>
#include <string>

namespace tsink {
namespace tools {
namespace cli {

using CommandFunction = std::function<int(void)>;
struct CommandInfo {
  std::string description;
  CommandFunction handler;
};
using HandlersMap = std::map<std::string, cli::CommandInfo>;

inline void PrintCommandsHelp(const std::string& command, const cli::HandlersMap& handlers) {
  std::cout << std::endl << "Available " << command << " subcommands: " << std::endl;
  for (const auto& [name, info] : handlers) {
    std::cout << "\t" << name << ": " << info.description << std::endl;
  }
}

inline std::string ShiftCommand(int& argc, char**& argv) {
  const std::string command = (argc > 1) ? std::string(argv[1]) : "";
  if (argc > 1) {
    --argc;
    ++argv;
  }
  return command;
}

inline int RunCommand(const std::string& command, const std::string& subcommand, const cli::HandlersMap& handlers) {
  auto it = handlers.find(subcommand);
  if (it == handlers.end()) {
    std::cerr << "Unrecognized subcommand: " << subcommand << std::endl;
    PrintCommandsHelp(command, handlers);
    return 1;
  }
  return it->second.handler();
}

// add all command handler main function declarations here
int write_main(int argc, char* argv[]);
int create_db_main(int argc, char* argv[]);

}  // namespace cli
}  // namespace tools
}  // namespace tsink

#endif  // TSINK_TOOLS_TSINK_CLI_COMMAND_HANDLERS_HPP
