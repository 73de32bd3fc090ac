#include "error.h"

namespace stackerr::core::error {

std::vector<Error> ErrorNode::causes() const {
    return {};
}

bool ErrorNode::is_match(const Error& target) const {
    STACKERR_UNUSED(target);
    return false;
}

std::string Error::message() const {
    return node_ ? node_->message() : std::string();
}

bool is(const Error& err, const Error& target) {
    if (!target) {
        return !err;
    }

    return walk(err, [&target](const Error& node) {
        return node == target || node->is_match(target);
    });
}

Error unwrap(const Error& err) {
    if (!err) {
        return {};
    }

    auto causes = err->causes();
    if (causes.size() != 1) {
        return {};
    }
    return causes.front();
}

} // namespace stackerr::core::error
