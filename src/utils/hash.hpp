#pragma once

#include <string>

namespace safexec::utils {

std::string Sha256Hex(const std::string& input);

}  // namespace safexec::utils
