#pragma once

#include <string>

namespace deflicker::runner {

int status_command(const std::string &checkpoint_dir);
int clear_command(const std::string &checkpoint_dir);

} // namespace deflicker::runner
