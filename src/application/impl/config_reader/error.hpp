#ifndef MASUMI_APPLICATION_CONFIG_READER_ERROR_HPP
#define MASUMI_APPLICATION_CONFIG_READER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace masumi::application {

  /**
   * Codes for errors that originate in configuration readers
   */
  enum class ConfigReaderError {
    MISSING_ENTRY = 1,
    PARSER_ERROR,
    INVALID_VALUE,
    FILE_NOT_FOUND
  };

}  // namespace masumi::application

MASUMI_OUTCOME_DECLARE_ERROR(masumi::application, ConfigReaderError)

#endif  // MASUMI_APPLICATION_CONFIG_READER_ERROR_HPP
