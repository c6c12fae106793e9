#pragma once

#include "wilab/core/errors.hpp"

// HTTP status code returned for each failure condition
inline int httpStatusFor(wilab::core::ErrorCode code) {
  switch (code) {
    case wilab::core::ErrorCode::ValidationFailed:
      return 400;
    case wilab::core::ErrorCode::UnknownNetwork:
      return 404;
    case wilab::core::ErrorCode::AlreadyActive:
    case wilab::core::ErrorCode::Busy:
    case wilab::core::ErrorCode::NotActive:
      return 409;
    case wilab::core::ErrorCode::DaemonStartFailed:
      return 502;
    case wilab::core::ErrorCode::RuleApplyFailed:
    case wilab::core::ErrorCode::PartialTeardown:
    case wilab::core::ErrorCode::CommandFailed:
      return 500;
  }
  return 500;
}
