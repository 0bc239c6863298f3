#include "seam_err.h"

const char *seam_err_to_name(esp_err_t err) {
  switch (err) {
  case SEAM_ERR_DEVICE_UNAVAILABLE:
    return "SEAM_ERR_DEVICE_UNAVAILABLE";
  case SEAM_ERR_PROTOCOL_VIOLATION:
    return "SEAM_ERR_PROTOCOL_VIOLATION";
  case SEAM_ERR_UPSTREAM_HANDSHAKE:
    return "SEAM_ERR_UPSTREAM_HANDSHAKE";
  case SEAM_ERR_UPSTREAM_TRANSPORT:
    return "SEAM_ERR_UPSTREAM_TRANSPORT";
  case SEAM_ERR_FINALIZE_TIMEOUT:
    return "SEAM_ERR_FINALIZE_TIMEOUT";
  case SEAM_ERR_TRANSLATION_FAILED:
    return "SEAM_ERR_TRANSLATION_FAILED";
  case SEAM_ERR_SYNTHESIS_FAILED:
    return "SEAM_ERR_SYNTHESIS_FAILED";
  case SEAM_ERR_MISSING_CREDENTIAL:
    return "SEAM_ERR_MISSING_CREDENTIAL";
  default:
    return esp_err_to_name(err);
  }
}
