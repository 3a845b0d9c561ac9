/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   registry of the segments found in a directory
*/

#include "common/common_pch.h"

#include "common/fs_sys_helpers.h"
#include "common/strings/formatting.h"
#include "unlink/segment_registry.h"
#include "unlink/tool_chain.h"

namespace umkv {
namespace unlink {

static debugging_option_c s_debug{"segment_registry"};

bool
same_file(bfs::path const &a,
          bfs::path const &b) {
  boost::system::error_code ec;
  auto equivalent = bfs::equivalent(a, b, ec);
  if (!ec)
    return equivalent;

  return bfs::absolute(a).lexically_normal() == bfs::absolute(b).lexically_normal();
}

void
segment_registry_c::add(registry_entry_t const &entry) {
  auto existing = m_entries.find(entry.id);
  if (existing != m_entries.end())
    throw duplicate_segment_x{entry.id, existing->second.file_name, entry.file_name};

  m_entries.insert(std::make_pair(entry.id, entry));
}

boost::optional<registry_entry_t>
segment_registry_c::resolve(std::string const &id,
                            bfs::path const &current_file)
  const
{
  auto entry = m_entries.find(id);
  if ((entry == m_entries.end()) || same_file(entry->second.file_name, current_file))
    return boost::none;

  return entry->second;
}

segment_registry_cptr
segment_registry_c::build(bfs::path const &directory,
                          tool_chain_c &tool_chain) {
  std::vector<bfs::path> files;
  boost::system::error_code ec;

  for (bfs::directory_iterator it{directory, ec}, end; !ec && (it != end); it.increment(ec))
    if (bfs::is_regular_file(it->status()) && balg::iequals(it->path().extension().string(), ".mkv"))
      files.push_back(it->path());

  if (ec)
    throw umkv::fs::file_operation_x{"read_directory", directory, ec.message()};

  brng::sort(files);

  auto registry = std::make_shared<segment_registry_c>();

  for (auto const &file : files) {
    segment_info_t info;

    try {
      info = tool_chain.probe_segment(file);
    } catch (umkv::exception &ex) {
      mxwarn_fn(file, boost::format(Y("The file could not be probed and is ignored for segment lookups: %1%\n")) % ex.error());
      continue;
    }

    mxdebug_if(s_debug, boost::format("%1%: segment %2% duration %3%\n") % file.string() % info.segment_uid % info.duration);

    registry->add(registry_entry_t{info.segment_uid, file, info.duration});
  }

  return registry;
}

// ------------------------------------------------------------

segment_registry_cache_c::segment_registry_cache_c(tool_chain_c &tool_chain)
  : m_tool_chain(tool_chain)
{
}

segment_registry_c const &
segment_registry_cache_c::get(bfs::path const &directory) {
  auto key = bfs::absolute(directory).lexically_normal();

  auto failure = m_failures.find(key);
  if (failure != m_failures.end())
    std::rethrow_exception(failure->second);

  auto registry = m_registries.find(key);
  if (registry != m_registries.end())
    return *registry->second;

  mxverb(2, boost::format(Y("Scanning '%1%' for linked segments.\n")) % key.string());

  try {
    auto new_registry = segment_registry_c::build(key, m_tool_chain);
    m_registries[key] = new_registry;
    return *new_registry;

  } catch (umkv::exception &) {
    m_failures[key] = std::current_exception();
    throw;
  }
}

}}
