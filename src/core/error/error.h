#pragma once

#ifndef CORE_ERROR_ERROR_H
#define CORE_ERROR_ERROR_H

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <config/config.h>

namespace stackerr::core::error {

class Error;
class StackCarrier;

/**
 * @brief One node of an error chain
 *
 * Implementations supply the message and, optionally, the errors they were
 * caused by. A node with exactly one cause is a plain wrap; a node with
 * several causes is a join and every branch is searched by is() and as().
 */
class ErrorNode {
public:
    virtual ~ErrorNode() = default;

    /**
     * @brief Full message of this node, including any wrapped text
     */
    virtual std::string message() const = 0;

    /**
     * @brief Errors this node directly wraps
     */
    virtual std::vector<Error> causes() const;

    /**
     * @brief Custom equivalence hook used by is()
     *
     * Identity is always checked first; override this for value-like
     * errors that compare equal without being the same node.
     */
    virtual bool is_match(const Error& target) const;

    /**
     * @brief "Has provenance" capability
     *
     * Non-null only for nodes that carry a stack trace.
     */
    virtual StackCarrier* provenance() noexcept { return nullptr; }
    virtual const StackCarrier* provenance() const noexcept { return nullptr; }
};

namespace detail {
StackCarrier* mutable_provenance(const Error& node) noexcept;
} // namespace detail

/**
 * @brief Nullable shared handle to an error chain
 *
 * A default-constructed handle is the absent error. Copies share the same
 * node, and equality is node identity, which makes any handle usable as a
 * sentinel:
 *
 * @code
 * const Error end_of_file = Error::make<MessageError>("EOF");
 * ...
 * if (is(err, end_of_file)) { ... }
 * @endcode
 */
class Error {
public:
    Error() noexcept = default;

    Error(std::nullptr_t) noexcept {}

    explicit Error(std::shared_ptr<ErrorNode> node) noexcept
        : node_(std::move(node)) {
    }

    /**
     * @brief Allocate a node and return its handle
     */
    template<typename Node, typename... Args>
    static Error make(Args&&... args) {
        return Error(std::make_shared<Node>(std::forward<Args>(args)...));
    }

    explicit operator bool() const noexcept { return node_ != nullptr; }

    /**
     * @brief Message of the chain, empty for the absent error
     */
    std::string message() const;

    const ErrorNode* get() const noexcept { return node_.get(); }

    const ErrorNode* operator->() const noexcept { return node_.get(); }

    const ErrorNode& operator*() const noexcept { return *node_; }

    std::shared_ptr<const ErrorNode> shared() const noexcept { return node_; }

    friend bool operator==(const Error& lhs, const Error& rhs) noexcept {
        return lhs.node_ == rhs.node_;
    }

    friend bool operator==(const Error& lhs, std::nullptr_t) noexcept {
        return lhs.node_ == nullptr;
    }

private:
    friend StackCarrier* detail::mutable_provenance(const Error& node) noexcept;

    std::shared_ptr<ErrorNode> node_;
};

/**
 * @brief Leaf error holding only a message
 */
class MessageError : public ErrorNode {
public:
    explicit MessageError(std::string message)
        : message_(std::move(message)) {
    }

    std::string message() const override { return message_; }

private:
    std::string message_;
};

/**
 * @brief Error with its own message and one or more causes
 *
 * With one cause this is a single-parent wrap and unwrap() returns the
 * cause. With several causes it is a join and unwrap() returns nothing,
 * but is() and as() still search every branch.
 */
class WrapError : public ErrorNode {
public:
    WrapError(std::string message, std::vector<Error> causes)
        : message_(std::move(message))
        , causes_(std::move(causes)) {
    }

    std::string message() const override { return message_; }

    std::vector<Error> causes() const override { return causes_; }

private:
    std::string message_;
    std::vector<Error> causes_;
};

/**
 * @brief Depth-first, pre-order walk over a chain
 *
 * Stops and returns true as soon as `visit` returns true.
 */
template<typename Visitor>
bool walk(const Error& err, Visitor&& visit) {
    if (!err) {
        return false;
    }
    if (visit(err)) {
        return true;
    }
    for (const auto& cause : err->causes()) {
        if (walk(cause, visit)) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Check whether any node of the chain matches `target`
 *
 * A node matches if it is the same node as `target` or its is_match()
 * accepts `target`. An absent target only matches an absent error.
 */
bool is(const Error& err, const Error& target);

/**
 * @brief The single cause of the top node
 *
 * Absent for leaves and for joins with more than one cause.
 */
Error unwrap(const Error& err);

/**
 * @brief First node of the chain whose dynamic type is T
 */
template<typename T>
std::shared_ptr<const T> as(const Error& err) {
    std::shared_ptr<const T> found;
    walk(err, [&found](const Error& node) {
        found = std::dynamic_pointer_cast<const T>(node.shared());
        return found != nullptr;
    });
    return found;
}

} // namespace stackerr::core::error

#endif // CORE_ERROR_ERROR_H
