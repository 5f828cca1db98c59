#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace opentimeline::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Base of everything render_timeline can fail with.
  A resolution either completes or throws one of these; never partial.
*/
class ResolutionError : public std::runtime_error {
 public:
  explicit ResolutionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed boolean expression. timeline_id is empty when the expression
// was parsed outside of a resolution (e.g. validation).
class ParseError : public ResolutionError {
 public:
  ParseError(std::size_t position, std::string reason, std::string timeline_id = {})
      : ResolutionError(Describe(position, reason, timeline_id)),
        position_(position),
        reason_(std::move(reason)),
        timeline_id_(std::move(timeline_id)) {
  }

  std::size_t Position() const {
    return position_;
  }
  const std::string& Reason() const {
    return reason_;
  }
  const std::string& TimelineId() const {
    return timeline_id_;
  }

  ParseError WithTimeline(const std::string& timeline_id) const {
    return ParseError(position_, reason_, timeline_id);
  }

 private:
  static std::string Describe(std::size_t position, const std::string& reason, const std::string& timeline_id) {
    std::string msg = "expression parse error at position " + std::to_string(position) + ": " + reason;
    if (!timeline_id.empty()) {
      msg += " (timeline " + timeline_id + ")";
    }
    return msg;
  }

  std::size_t position_;
  std::string reason_;
  std::string timeline_id_;
};

// Subtimeline cycle. path starts and ends with the re-entered timeline.
class CycleError : public ResolutionError {
 public:
  explicit CycleError(std::vector<std::string> path) : ResolutionError(Describe(path)), path_(std::move(path)) {
  }

  const std::vector<std::string>& Path() const {
    return path_;
  }

 private:
  static std::string Describe(const std::vector<std::string>& path) {
    std::string msg = "subtimeline cycle detected: ";
    for (std::size_t i = 0; i < path.size(); ++i) {
      if (i) msg += " -> ";
      msg += path[i];
    }
    return msg;
  }

  std::vector<std::string> path_;
};

} // namespace opentimeline::util
