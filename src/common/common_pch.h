/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   precompiled header: headers used by all source files
*/

#ifndef UMKV_COMMON_COMMON_PCH_H
#define UMKV_COMMON_COMMON_PCH_H

#include <algorithm>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <cinttypes>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/range/algorithm.hpp>
#include <boost/regex.hpp>
#include <boost/system/error_code.hpp>

namespace balg = boost::algorithm;
namespace bfs  = boost::filesystem;
namespace brng = boost::range;

#include "common/common.h"
#include "common/error.h"

#endif // UMKV_COMMON_COMMON_PCH_H
