#include "annotated_error.h"

namespace stackerr::core::error {

namespace detail {

StackCarrier* mutable_provenance(const Error& node) noexcept {
    return node.node_ ? node.node_->provenance() : nullptr;
}

Error find_stack_node(const Error& err) {
    Error found;
    walk(err, [&found](const Error& node) {
        if (node->provenance() != nullptr) {
            found = node;
            return true;
        }
        return false;
    });
    return found;
}

} // namespace detail

Stack stack_of(const Error& err) {
    Error node = detail::find_stack_node(err);
    if (!node) {
        return {};
    }
    return node->provenance()->stack();
}

bool has_stack(const Error& err) {
    return static_cast<bool>(detail::find_stack_node(err));
}

Error new_with_stack(const Error& err, Stack frames) {
    if (!err) {
        return {};
    }

    if (Error node = detail::find_stack_node(err)) {
        StackCarrier* carrier = detail::mutable_provenance(node);
        carrier->replace_stack(append_stack_trace(frames, carrier->stack()));
        return node;
    }

    return Error::make<AnnotatedError>(err, std::move(frames));
}

Error annotate(Error underlying, Stack frames, const std::vector<Error>& sources) {
    Stack stack = std::move(frames);
    for (const auto& source : sources) {
        if (Error node = detail::find_stack_node(source)) {
            stack = append_stack_trace(stack, node->provenance()->stack());
        }
    }
    return Error::make<AnnotatedError>(std::move(underlying), std::move(stack));
}

} // namespace stackerr::core::error
