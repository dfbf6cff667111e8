#pragma once

namespace datalens {
namespace obs {

inline constexpr const char* kErrHttpBadRequest = "E_HTTP_BAD_REQUEST";
inline constexpr const char* kErrHttpInvalidArgument = "E_HTTP_INVALID_ARGUMENT";
inline constexpr const char* kErrHttpMissingField = "E_HTTP_MISSING_FIELD";
inline constexpr const char* kErrHttpJsonParseError = "E_HTTP_JSON_PARSE_ERROR";
inline constexpr const char* kErrHttpPayloadTooLarge = "E_HTTP_PAYLOAD_TOO_LARGE";

inline constexpr const char* kErrEmptyDataset = "E_EMPTY_DATASET";
inline constexpr const char* kErrMalformedRow = "E_MALFORMED_ROW";
inline constexpr const char* kErrInsufficientData = "E_INSUFFICIENT_DATA";
inline constexpr const char* kErrGenerationTimeout = "E_GENERATION_TIMEOUT";
inline constexpr const char* kErrGenerationFailed = "E_GENERATION_FAILED";
inline constexpr const char* kErrCancelled = "E_CANCELLED";

inline constexpr const char* kErrInternal = "E_INTERNAL";

} // namespace obs
} // namespace datalens
