#pragma once

#include <string>

namespace ragdesk_core::uuid {

// Random RFC 4122 version 4 identifier in canonical lowercase form.
std::string generate();

}  // namespace ragdesk_core::uuid
