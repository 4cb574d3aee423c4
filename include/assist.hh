#pragma once

#include "feedback.hh"
#include "solver.hh"

#include <iosfwd>
#include <optional>
#include <string>

namespace opener
{
// Parse feedback as typed by a player. Accepted forms (spaces, commas and
// dashes are ignored):
//   GYBBB      - green, yellow, black/grey letters, any case.
//   21000      - 2 green, 1 yellow, 0 black.
//   coloured squares (green, yellow, black or white).
//   colour words, e.g. 'green yellow grey grey black'.
//   won/win/solved for all green.
// Throws std::invalid_argument for anything else.
feedback parse_feedback_input(const std::string& input);

// Suggest guesses for a game being played elsewhere, reading the feedback the
// player received from `in` after each one.
void run_assist(const solver& solv, const std::optional<std::string>& starter,
                std::istream& in);
} // namespace opener
