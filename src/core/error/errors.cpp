#include "errors.h"

namespace stackerr::core::error {

namespace detail {

Error formatted_error(std::string message, std::vector<Error> causes,
                      const std::source_location& loc) {
    if (causes.empty()) {
        return new_with_stack(Error::make<MessageError>(std::move(message)), caller(loc));
    }

    // Keep the stacks of wrapped arguments instead of merging into one of them
    auto sources = causes;
    return annotate(Error::make<WrapError>(std::move(message), std::move(causes)),
                    caller(loc), sources);
}

Error wrap_message(const Error& err, std::string message,
                   const std::source_location& loc) {
    std::string text = std::move(message);
    text += ": ";
    text += err.message();

    return annotate(Error::make<WrapError>(std::move(text), std::vector<Error>{err}),
                    caller(loc), {err});
}

} // namespace detail

Error make_error(std::string_view message, const std::source_location& loc) {
    return new_with_stack(Error::make<MessageError>(std::string(message)), caller(loc));
}

Error with_stack(const Error& err, const std::source_location& loc) {
    if (!err) {
        return {};
    }
    return new_with_stack(err, caller(loc));
}

Error wrap(const Error& err, std::string_view message, const std::source_location& loc) {
    if (!err) {
        return {};
    }
    return detail::wrap_message(err, std::string(message), loc);
}

Error wrap_with_cause(const Error& err, const Error& cause, const std::source_location& loc) {
    if (!err) {
        return {};
    }
    if (!cause) {
        return new_with_stack(err, caller(loc));
    }

    std::string text = err.message();
    text += ": ";
    text += cause.message();

    return annotate(Error::make<WrapError>(std::move(text), std::vector<Error>{err, cause}),
                    caller(loc), {err, cause});
}

} // namespace stackerr::core::error
