/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   reconstruction of a linear timeline from linked chapters
*/

#include "common/common_pch.h"

#include "common/process.h"
#include "common/strings/formatting.h"
#include "unlink/timeline.h"

namespace umkv {
namespace unlink {

static debugging_option_c s_debug{"timeline"};

timeline_state_t::timeline_state_t()
  : offset{timecode_c::ns(0)}
  , timeline_end{timecode_c::ns(0)}
  , last_internal_end{timecode_c::ns(0)}
  , run_start{timecode_c::ns(0)}
  , run_end{timecode_c::ns(0)}
  , last_split_point{timecode_c::ns(0)}
  , external_seen{}
  , internal_run_after_external{}
  , chapter_index{}
{
}

bool
timeline_t::has_external_references()
  const
{
  return brng::find_if(steps, [](step_t const &step) { return sk_internal != step.kind; }) != steps.end();
}

static step_result_t
internal_step(timeline_state_t const &state,
              chapters::chapter_entry_c const &chapter) {
  step_result_t result;
  auto &new_state = result.state;
  auto &step      = result.step;

  new_state                   = state;
  step.kind                   = sk_internal;
  step.start                  = chapter.get_start() + state.offset;
  step.end                    = chapter.get_end()   + state.offset;

  new_state.timeline_end      = step.end;
  new_state.last_internal_end = chapter.get_end();
  new_state.last_external_id  = boost::none;

  if (state.external_seen)
    new_state.internal_run_after_external = true;

  return result;
}

static step_result_t
continuation_step(timeline_state_t const &state,
                  chapters::chapter_entry_c const &chapter) {
  step_result_t result;
  auto &step   = result.step;

  result.state = state;
  step.kind    = sk_continuation;
  step.start   = std::min(state.run_start + chapter.get_start(), state.run_end);
  step.end     = std::min(state.run_start + chapter.get_end(),   state.run_end);

  return result;
}

static step_result_t
new_external_step(timeline_state_t const &state,
                  chapters::chapter_entry_c const &chapter,
                  std::string const &id,
                  segment_resolver_t const &resolve) {
  auto entry = resolve(id);
  if (!entry)
    throw missing_segment_x{id, state.chapter_index + 1};

  step_result_t result;
  auto &new_state = result.state;
  auto &step      = result.step;

  new_state       = state;
  step.kind       = sk_new_external;
  step.external   = entry;

  if (!state.last_internal_end.is_zero() && (state.last_internal_end > state.last_split_point)) {
    result.split_point         = state.last_internal_end;
    new_state.last_split_point = state.last_internal_end;
  }

  // Segments without a duration element are assumed to be exactly as
  // long as the chapter referencing them.
  auto duration = entry->duration.valid() ? entry->duration : chapter.get_end();

  step.start                            = state.timeline_end;
  step.end                              = state.timeline_end + chapter.get_end();
  new_state.run_start                   = state.timeline_end;
  new_state.run_end                     = state.timeline_end + duration;
  new_state.timeline_end                = new_state.run_end;
  new_state.offset                      = state.offset + duration;
  new_state.last_external_id            = id;
  new_state.external_seen               = true;
  new_state.internal_run_after_external = false;

  return result;
}

step_result_t
timeline_step(timeline_state_t const &state,
              chapters::chapter_entry_c const &chapter,
              segment_resolver_t const &resolve) {
  step_result_t result;

  auto const &uid = chapter.get_segment_uid();

  if (!chapter.is_enabled() || !uid)
    result = internal_step(state, chapter);

  else if (state.last_external_id && (*state.last_external_id == uid->get_id()))
    result = continuation_step(state, chapter);

  else
    result = new_external_step(state, chapter, uid->get_id(), resolve);

  result.step.chapter_index    = state.chapter_index;
  result.step.original_start   = chapter.get_start();
  result.step.original_end     = chapter.get_end();
  result.state.chapter_index   = state.chapter_index + 1;

  return result;
}

boost::optional<timecode_c>
timeline_finish(timeline_state_t const &state) {
  if (   state.internal_run_after_external
      && !state.last_internal_end.is_zero()
      && (state.last_internal_end > state.last_split_point))
    return state.last_internal_end;

  return boost::none;
}

static char const *
step_kind_name(step_kind_e kind) {
  return sk_internal     == kind ? "internal"
       : sk_new_external == kind ? "external"
       :                           "continuation";
}

timeline_t
build_timeline(chapters::chapters_c &chapters,
               size_t edition,
               segment_resolver_t const &resolve) {
  auto entries = chapters.get_entries(edition);
  timeline_t timeline;
  timeline_state_t state;

  for (auto &chapter : entries) {
    auto result = timeline_step(state, chapter, resolve);
    auto &step  = result.step;

    chapter.set_start(step.start);
    chapter.set_end(step.end);
    if (chapter.has_segment_uid())
      chapter.drop_segment_uid();

    if (result.split_point)
      timeline.split_points.push_back(*result.split_point);

    mxverb(3, boost::format("chapter %1% (%2%): %3% - %4% -> %5% - %6%, offset %7%\n")
           % (step.chapter_index + 1) % step_kind_name(step.kind) % step.original_start % step.original_end % step.start % step.end % result.state.offset);

    timeline.steps.push_back(step);
    state = result.state;
  }

  auto final_split_point = timeline_finish(state);
  if (final_split_point)
    timeline.split_points.push_back(*final_split_point);

  timeline.offset = state.offset;

  mxdebug_if(s_debug, boost::format("%1% steps, %2% split points, final offset %3%\n") % timeline.steps.size() % timeline.split_points.size() % timeline.offset);

  chapters.select_edition(edition);
  chapters.clear_ordered_flag();

  return timeline;
}

std::vector<part_c>
assign_parts(std::vector<step_t> const &steps,
             boost::optional<split_result_t> const &split,
             bfs::path const &original_file,
             bool ignore_segment_start) {
  std::vector<part_c> parts;
  size_t num_slices_used = 0;
  auto in_internal_run   = false;

  for (auto const &step : steps) {
    if (sk_continuation == step.kind)
      continue;

    if (sk_new_external == step.kind) {
      in_internal_run = false;
      if (ignore_segment_start || (step.original_start < timecode_c::s(1)))
        parts.emplace_back(part_c::k_external, step.external->file_name);
      continue;
    }

    if (in_internal_run)
      continue;

    in_internal_run = true;

    if (!split) {
      parts.emplace_back(part_c::k_internal, original_file);
      continue;
    }

    if (num_slices_used >= split->slices.size())
      throw umkv::process::external_tool_failure_x{split->command_line, 0, split->output,
          (boost::format(Y("Splitting '%1%' resulted in %2% file(s), but more are needed for the internal chapters.")) % original_file.string() % split->slices.size()).str()};

    ++num_slices_used;
    parts.emplace_back(part_c::k_internal, split->slices[num_slices_used - 1], num_slices_used);
  }

  return parts;
}

}}
