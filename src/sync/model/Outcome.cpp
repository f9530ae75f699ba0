#include "sync/model/Outcome.hpp"

namespace ms::sync::model {

std::string to_string(const Outcome::Status status) {
    switch (status) {
    case Outcome::Status::COPIED: return "copied";
    case Outcome::Status::SKIPPED: return "skipped";
    case Outcome::Status::DELETED: return "deleted";
    case Outcome::Status::ERROR: return "error";
    }
    return "unknown";
}

std::string Outcome::statusToString() const { return to_string(status); }

}
