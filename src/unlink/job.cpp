/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   processing of one input file
*/

#include "common/common_pch.h"

#include <set>

#include "common/at_scope_exit.h"
#include "common/fs_sys_helpers.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "unlink/job.h"
#include "unlink/style_unifier.h"

namespace umkv {
namespace unlink {

static debugging_option_c s_debug{"job"};

unlink_job_c::unlink_job_c(options_c const &options,
                           tool_chain_c &tool_chain,
                           segment_registry_cache_c &registries,
                           bfs::path const &file_name,
                           size_t job_number)
  : m_options(options)
  , m_tool_chain(tool_chain)
  , m_registries(registries)
  , m_file_name{file_name}
  , m_stem{file_name.stem().string()}
{
  m_work_dir        = m_options.m_tmpdir / to_string(static_cast<int64_t>(umkv::get_current_process_id())) / (boost::format("%1%-%2%") % job_number % m_stem).str();
  m_parts_dir       = m_work_dir / "parts";
  m_subtitles_dir   = m_work_dir / "subtitles";
  m_attachments_dir = m_work_dir / "attachments";
  m_output_dir      = m_work_dir / "output";
}

void
unlink_job_c::create_work_dirs() {
  for (auto const &dir : { m_parts_dir, m_subtitles_dir, m_attachments_dir, m_output_dir })
    umkv::fs::create_directories(dir);
}

void
unlink_job_c::remove_work_dir() {
  try {
    umkv::fs::remove_all(m_work_dir);
  } catch (umkv::fs::exception &ex) {
    mxwarn(boost::format(Y("The temporary directory '%1%' could not be removed: %2%\n")) % m_work_dir.string() % ex.error());
  }
}

chapters::chapters_cptr
unlink_job_c::read_chapters() {
  auto content = m_tool_chain.extract_chapters(m_file_name);
  if (strip_copy(content, true).empty())
    return chapters::chapters_cptr{};

  auto chapters = chapters::chapters_c::parse(content);
  return chapters->has_segment_links() ? chapters : chapters::chapters_cptr{};
}

std::vector<metadata_edit_t>
unlink_job_c::collect_metadata(segment_info_t const &info)
  const
{
  std::vector<metadata_edit_t> edits;

  if (!info.title.empty())
    edits.emplace_back("info", "title", info.title);

  std::map<track_type_e, unsigned int> num_tracks_by_type;

  for (auto const &track : info.tracks) {
    if ((tt_audio != track.type) && (tt_subtitles != track.type))
      continue;

    auto selector = (boost::format("track:%1%%2%") % (tt_audio == track.type ? 'a' : 's') % ++num_tracks_by_type[track.type]).str();

    edits.emplace_back(selector, "language", track.language);
    if (!track.name.empty())
      edits.emplace_back(selector, "name", track.name);
    edits.emplace_back(selector, "flag-default", track.default_flag ? "1" : "0");
  }

  return edits;
}

std::vector<extracted_attachment_t>
unlink_job_c::collect_attachments(std::vector<bfs::path> const &source_files) {
  std::vector<extracted_attachment_t> collected;
  std::set<std::string> names;

  for (auto const &source_file : source_files) {
    std::vector<attachment_info_t> to_extract;

    for (auto const &attachment : m_tool_chain.probe_segment(source_file).attachments) {
      auto name = bfs::path{attachment.name}.filename().string();
      if (name.empty() || names.count(name)) {
        mxverb(2, boost::format("skipping duplicate attachment '%1%' in '%2%'\n") % attachment.name % source_file.string());
        continue;
      }

      names.insert(name);
      to_extract.push_back(attachment);
    }

    if (to_extract.empty())
      continue;

    mxverb(2, boost::format("extracting %1% attachment(s) from '%2%'\n") % to_extract.size() % source_file.string());

    auto extracted = m_tool_chain.extract_attachments(source_file, to_extract, m_attachments_dir);
    collected.insert(collected.end(), extracted.begin(), extracted.end());
  }

  return collected;
}

std::vector<bfs::path>
unlink_job_c::realize_parts(timeline_t const &timeline) {
  boost::optional<split_result_t> split;

  if (!timeline.split_points.empty()) {
    mxinfo_fn(m_file_name, boost::format(Y("Splitting at %1% point(s).\n")) % timeline.split_points.size());
    split = m_tool_chain.split_file(m_file_name, timeline.split_points, m_parts_dir);
  }

  std::vector<bfs::path> parts;
  for (auto const &part : assign_parts(timeline.steps, split, m_file_name, m_options.m_ignore_segment_start)) {
    mxverb(2, boost::format("part %1%\n") % part.get_file_name().string());
    parts.push_back(part.get_file_name());
  }

  return parts;
}

std::vector<bfs::path>
unlink_job_c::fix_subtitles(std::vector<bfs::path> const &parts,
                            std::vector<extracted_attachment_t> const &attachments) {
  std::vector<std::vector<extracted_track_t>> subtitles_by_part;
  std::vector<bfs::path> subtitle_files;

  for (auto idx = 0u; parts.size() > idx; ++idx) {
    auto directory = m_subtitles_dir / to_string(static_cast<int64_t>(idx + 1));
    umkv::fs::create_directories(directory);

    subtitles_by_part.push_back(m_tool_chain.extract_subtitle_tracks(parts[idx], directory));
    for (auto const &track : subtitles_by_part.back())
      subtitle_files.push_back(track.file_name);
  }

  if (subtitle_files.empty())
    return parts;

  mxinfo_fn(m_file_name, boost::format(Y("Unifying the styles of %1% subtitle track(s).\n")) % subtitle_files.size());

  unify_styles(subtitle_files, m_options.m_play_res_x, m_options.m_play_res_y);

  auto fixed_parts = parts;

  for (auto idx = 0u; parts.size() > idx; ++idx) {
    if (subtitles_by_part[idx].empty())
      continue;

    auto output = m_parts_dir / (boost::format("%1%-fixsubs.mkv") % (idx + 1)).str();
    m_tool_chain.remux_subtitles(parts[idx], subtitles_by_part[idx], attachments, output);
    fixed_parts[idx] = output;
  }

  return fixed_parts;
}

// Extracts the subtitle tracks of the merged file and muxes them back
// in, replacing the appended tracks. Returns the file to continue with.
bfs::path
unlink_job_c::remux_merged_subtitles(bfs::path const &merged) {
  auto directory = m_subtitles_dir / "merged";
  umkv::fs::create_directories(directory);

  auto subtitles = m_tool_chain.extract_subtitle_tracks(merged, directory);
  if (subtitles.empty())
    return merged;

  mxverb(2, boost::format("remuxing %1% subtitle track(s) of the merged file\n") % subtitles.size());

  auto output = merged.parent_path() / ("fixed." + merged.filename().string());
  m_tool_chain.replace_subtitles(merged, subtitles, output);

  return output;
}

unlink_result_t
unlink_job_c::run() {
  unlink_result_t result{m_file_name, us_not_linked};

  mxinfo_fn(m_file_name, Y("Processing.\n"));

  auto chapters = read_chapters();
  if (!chapters) {
    mxinfo_fn(m_file_name, Y("The file is not linked.\n"));
    return result;
  }

  create_work_dirs();

  at_scope_exit_c cleanup{[this]() {
    if (m_options.m_cleanup)
      remove_work_dir();
  }};

  mxdebug_if(s_debug, boost::format("work directory %1%\n") % m_work_dir.string());

  chapters->save(m_work_dir / (m_stem + "-chapters-original.xml"));

  if (!m_options.m_ignore_default_flag) {
    auto num_dropped = chapters->drop_non_default_editions();
    if (num_dropped)
      mxwarn_fn(m_file_name, boost::format(NY("%1% non-default edition was removed.\n", "%1% non-default editions were removed.\n", num_dropped)) % num_dropped);
  }

  auto &registry = m_registries.get(m_file_name.parent_path());
  auto file_name = m_file_name;
  auto timeline  = build_timeline(*chapters, m_options.m_edition, [&registry, &file_name](std::string const &id) {
    return registry.resolve(id, file_name);
  });

  auto chapters_file = m_work_dir / (m_stem + "-chapters.xml");
  chapters->save(chapters_file);

  std::vector<bfs::path> source_files{ m_file_name };
  for (auto const &step : timeline.steps)
    if (step.external && !brng::count(source_files, step.external->file_name)) {
      mxinfo_fn(m_file_name, boost::format(Y("Found the linked segment '%1%'.\n")) % step.external->file_name.string());
      source_files.push_back(step.external->file_name);
    }

  auto metadata    = collect_metadata(m_tool_chain.probe_segment(m_file_name));
  auto attachments = collect_attachments(source_files);
  auto parts       = realize_parts(timeline);

  if (m_options.m_fix_subtitles)
    parts = fix_subtitles(parts, attachments);

  mxinfo_fn(m_file_name, boost::format(Y("Merging %1% part(s).\n")) % parts.size());

  auto output = m_tool_chain.mux_parts(parts, m_options.m_chapters ? boost::optional<bfs::path>{chapters_file} : boost::none, m_output_dir / m_file_name.filename());

  if (m_options.m_fix_subtitles)
    output = remux_merged_subtitles(output);

  m_tool_chain.apply_metadata(output, metadata);

  umkv::fs::create_directories(m_options.m_outdir);
  result.output = m_options.m_outdir / m_file_name.filename();
  umkv::fs::move_file(output, result.output);

  result.status = us_converted;

  mxinfo_fn(m_file_name, boost::format(Y("Written to '%1%'.\n")) % result.output.string());

  return result;
}

}}
