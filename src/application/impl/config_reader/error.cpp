#include "application/impl/config_reader/error.hpp"

MASUMI_OUTCOME_DEFINE_CATEGORY(masumi::application, ConfigReaderError, e) {
  using E = masumi::application::ConfigReaderError;
  switch (e) {
    case E::MISSING_ENTRY:
      return "A required entry is missing in the provided config";
    case E::PARSER_ERROR:
      return "Config file is not a valid JSON object";
    case E::INVALID_VALUE:
      return "A config entry has an invalid value";
    case E::FILE_NOT_FOUND:
      return "Config file cannot be opened";
  }
  return "Unknown error";
}
