/**
 * @file errors.hpp
 * @brief Exception types raised by the selection pipeline
 *
 * @details
 *          - DecodeError: media cannot be read; fatal for one video only
 *
 *          - ConfigurationError: one configuration value is invalid; always
 *            recovered inside the configuration layer
 */

#ifndef ACTION_SHORTS_ERRORS_HPP
#define ACTION_SHORTS_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace action_shorts {

/**
 * @class DecodeError
 * @brief The source video or its audio track could not be read.
 */
class DecodeError : public std::runtime_error {
public:
  explicit DecodeError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @class ConfigurationError
 * @brief A configuration value could not be parsed or is out of range.
 */
class ConfigurationError : public std::runtime_error {
public:
  ConfigurationError(std::string field, const std::string &what)
      : std::runtime_error(what), field_(std::move(field)) {}

  const std::string &field() const { return field_; }

private:
  std::string field_;
};

} // namespace action_shorts

#endif // ACTION_SHORTS_ERRORS_HPP
