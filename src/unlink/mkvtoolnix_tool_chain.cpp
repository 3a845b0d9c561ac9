/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   tool chain running mkvextract, mkvmerge and mkvpropedit
*/

#include "common/common_pch.h"

#include "common/fs_sys_helpers.h"
#include "common/process.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "unlink/kax_segment_prober.h"
#include "unlink/mkvtoolnix_tool_chain.h"

namespace umkv {
namespace unlink {

// mkvmerge's exit code 1 means "finished with warnings".
static int const s_mkvmerge_max_ok_exit_code = 1;

mkvtoolnix_tool_chain_c::mkvtoolnix_tool_chain_c(tool_paths_t const &paths)
  : m_paths(paths)
{
}

std::vector<std::string>
mkvtoolnix_tool_chain_c::with_ui_language(std::vector<std::string> args)
  const {
  args.insert(args.begin(), { "--ui-language", m_paths.ui_language });
  return args;
}

std::string
mkvtoolnix_tool_chain_c::run(std::string const &program,
                             std::vector<std::string> args,
                             int max_ok_exit_code) {
  return umkv::process::run_checked(program, with_ui_language(args), max_ok_exit_code).out;
}

segment_info_t
mkvtoolnix_tool_chain_c::probe_segment(bfs::path const &file_name) {
  return probe_kax_segment(file_name);
}

std::string
mkvtoolnix_tool_chain_c::extract_chapters(bfs::path const &file_name) {
  return run(m_paths.mkvextract, { "chapters", file_name.string() });
}

split_result_t
mkvtoolnix_tool_chain_c::split_file(bfs::path const &file_name,
                                    std::vector<timecode_c> const &split_points,
                                    bfs::path const &directory) {
  std::vector<std::string> timecodes;
  for (auto const &split_point : split_points)
    timecodes.push_back(format_timecode(split_point));

  auto args   = with_ui_language({ "--no-chapters", "-o", (directory / "split-%03d.mkv").string(), file_name.string(), "--split", "timecodes:" + balg::join(timecodes, ",") });
  auto result = umkv::process::run_checked(m_paths.mkvmerge, args, s_mkvmerge_max_ok_exit_code);

  split_result_t split;
  split.command_line = umkv::process::format_command_line(m_paths.mkvmerge, args);
  split.output       = strip_copy(result.out + result.err, true);

  static boost::regex s_slice_re("^split-\\d{3}\\.mkv$", boost::regex::perl);

  auto &slices = split.slices;
  boost::system::error_code ec;
  for (bfs::directory_iterator it{directory, ec}, end; !ec && (it != end); it.increment(ec))
    if (boost::regex_match(it->path().filename().string(), s_slice_re))
      slices.push_back(it->path());

  if (ec)
    throw umkv::fs::file_operation_x{"read_directory", directory, ec.message()};

  brng::sort(slices);

  return split;
}

std::vector<extracted_track_t>
mkvtoolnix_tool_chain_c::extract_subtitle_tracks(bfs::path const &file_name,
                                                 bfs::path const &directory) {
  std::vector<extracted_track_t> tracks;
  std::vector<std::string> args{ "tracks", file_name.string() };

  for (auto const &track : probe_segment(file_name).tracks) {
    if (!track.is_text_subtitles())
      continue;

    auto output = directory / (boost::format("%1%-%2%.ass") % file_name.filename().string() % track.id).str();
    tracks.emplace_back(track.id, output);
    args.push_back((boost::format("%1%:%2%") % track.id % output.string()).str());
  }

  if (!tracks.empty())
    run(m_paths.mkvextract, args);

  return tracks;
}

std::vector<extracted_attachment_t>
mkvtoolnix_tool_chain_c::extract_attachments(bfs::path const &file_name,
                                             std::vector<attachment_info_t> const &attachments,
                                             bfs::path const &directory) {
  std::vector<extracted_attachment_t> extracted;
  std::vector<std::string> args{ "attachments", file_name.string() };

  for (auto const &attachment : attachments) {
    auto output = directory / bfs::path{attachment.name}.filename();
    extracted.emplace_back(output, attachment.mime_type);
    args.push_back((boost::format("%1%:%2%") % attachment.id % output.string()).str());
  }

  if (!extracted.empty())
    run(m_paths.mkvextract, args);

  return extracted;
}

void
mkvtoolnix_tool_chain_c::remux_subtitles(bfs::path const &part,
                                         std::vector<extracted_track_t> const &subtitles,
                                         std::vector<extracted_attachment_t> const &attachments,
                                         bfs::path const &output) {
  std::vector<std::string> args{ "-o", output.string(), "--no-chapters", "--no-subs", "--no-attachments", part.string() };

  for (auto const &subtitle : subtitles)
    args.push_back(subtitle.file_name.string());

  for (auto const &attachment : attachments) {
    args.push_back("--attachment-mime-type");
    args.push_back(attachment.mime_type.empty() ? std::string{"application/octet-stream"} : attachment.mime_type);
    args.push_back("--attach-file");
    args.push_back(attachment.file_name.string());
  }

  run(m_paths.mkvmerge, args, s_mkvmerge_max_ok_exit_code);
}

void
mkvtoolnix_tool_chain_c::replace_subtitles(bfs::path const &file_name,
                                           std::vector<extracted_track_t> const &subtitles,
                                           bfs::path const &output) {
  std::vector<std::string> args{ "-o", output.string(), "-S", file_name.string() };

  for (auto const &subtitle : subtitles)
    args.push_back(subtitle.file_name.string());

  run(m_paths.mkvmerge, args, s_mkvmerge_max_ok_exit_code);
}

bfs::path
mkvtoolnix_tool_chain_c::mux_parts(std::vector<bfs::path> const &parts,
                                   boost::optional<bfs::path> const &chapters,
                                   bfs::path const &output) {
  std::vector<std::string> args{ "--no-chapters", "-M" };

  if (chapters) {
    args.push_back("--chapters");
    args.push_back(chapters->string());
  }

  args.push_back("-o");
  args.push_back(output.string());

  for (auto idx = 0u; parts.size() > idx; ++idx) {
    if (idx)
      args.push_back("+");
    args.push_back(parts[idx].string());
  }

  run(m_paths.mkvmerge, args, s_mkvmerge_max_ok_exit_code);

  return output;
}

void
mkvtoolnix_tool_chain_c::apply_metadata(bfs::path const &file_name,
                                        std::vector<metadata_edit_t> const &edits) {
  if (edits.empty())
    return;

  std::vector<std::string> args{ file_name.string() };
  std::string current_selector;

  for (auto const &edit : edits) {
    if (edit.selector != current_selector) {
      args.push_back("--edit");
      args.push_back(edit.selector);
      current_selector = edit.selector;
    }

    args.push_back("--set");
    args.push_back(edit.property + "=" + edit.value);
  }

  run(m_paths.mkvpropedit, args);
}

std::string
mkvtoolnix_tool_chain_c::query_mkvmerge_version() {
  return strip_copy(umkv::process::run_checked(m_paths.mkvmerge, { "--version" }).out, true);
}

}}
