#pragma once
#include <map>
#include <string>

namespace workpipe {

// Variable name -> value handed to a worker script
using Environment = std::map<std::string, std::string>;

} // namespace workpipe
