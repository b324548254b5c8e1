/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(lightbabe::log, Error, e) {
  using E = lightbabe::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::WRONG_LOGGER:
      return "Unknown logger";
  }
  return "Unknown log::Error";
}

namespace lightbabe::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(logging_system,
                       "Logging system is not ready. "
                       "lightbabe::log::setLoggingSystem() must be called "
                       "before any logger is created");
      return logging_system;
    }

    std::shared_ptr<soralog::LoggerFactory> loggerFactory() {
      return std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem());
    }
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "verbose") {
      return Level::VERBOSE;
    }
    if (str == "info" or str == "inf") {
      return Level::INFO;
    }
    if (str == "warning" or str == "warn") {
      return Level::WARN;
    }
    if (str == "error" or str == "err") {
      return Level::ERROR;
    }
    if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    }
    if (str == "off" or str == "no") {
      return Level::OFF;
    }
    return Error::WRONG_LEVEL;
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  outcome::result<void> tuneLoggingSystem(const std::vector<std::string> &cfg) {
    auto logging_system = loggingSystem();

    for (const auto &chunk : cfg) {
      std::string_view override_str{chunk};
      auto eq_pos = override_str.find('=');

      // bare level is applied to the whole project
      if (eq_pos == std::string_view::npos) {
        OUTCOME_TRY(level, str2lvl(override_str));
        logging_system->setLevelOfGroup(defaultGroupName, level);
        continue;
      }

      std::string group_name{override_str.substr(0, eq_pos)};
      if (not logging_system->getGroup(group_name)) {
        return Error::WRONG_GROUP;
      }
      OUTCOME_TRY(level, str2lvl(override_str.substr(eq_pos + 1)));
      logging_system->setLevelOfGroup(group_name, level);
    }
    return outcome::success();
  }

  Logger createLogger(const std::string &tag) {
    return loggerFactory()->getLogger(tag, defaultGroupName);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return loggerFactory()->getLogger(tag, group);
  }

  Logger createLogger(const std::string &tag,
                      const std::string &group,
                      Level level) {
    return loggerFactory()->getLogger(tag, group, level);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

  bool resetLevelOfGroup(const std::string &group_name) {
    return loggingSystem()->resetLevelOfGroup(group_name);
  }

  bool setLevelOfLogger(const std::string &logger_name, Level level) {
    return loggingSystem()->setLevelOfLogger(logger_name, level);
  }

  bool resetLevelOfLogger(const std::string &logger_name) {
    return loggingSystem()->resetLevelOfLogger(logger_name);
  }

}  // namespace lightbabe::log
