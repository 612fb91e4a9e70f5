#include "broker.h"

namespace fxstack {

std::string_view to_string(BrokerError error) {
  switch (error) {
  case BrokerError::NetworkError:
    return "network error";
  case BrokerError::RejectedError:
    return "rejected";
  case BrokerError::NotFound:
    return "not found";
  case BrokerError::ParseError:
    return "parse error";
  case BrokerError::UnknownError:
    break;
  }
  return "unknown error";
}

} // namespace fxstack
