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

#include "tsink/tools/tsink-cli/command_handlers.hpp"
#include "tsink/tools/tsink-cli/constants.hpp"

using namespace tsink::tools;

int main(int argc, char* argv[]) {
  const std::string command = cli::ShiftCommand(argc, argv);

  cli::HandlersMap handlers{
      {"write", {cli::write_desc.data(), [argc, argv]() { return cli::write_main(argc, argv); }}},
      {"create-db", {cli::create_db_desc.data(), [argc, argv]() { return cli::create_db_main(argc, argv); }}},
  };

  if (command.empty()) {
    std::cout << "Must specify a command... " << std::endl;
    cli::PrintCommandsHelp(cli::root_command.data(), handlers);
    return 0;
  }

  return cli::RunCommand(cli::root_command.data(), command, handlers);
}
