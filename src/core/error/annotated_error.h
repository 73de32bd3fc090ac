#pragma once

#ifndef CORE_ERROR_ANNOTATED_ERROR_H
#define CORE_ERROR_ANNOTATED_ERROR_H

#include <string>
#include <utility>
#include <vector>

#include "error.h"
#include "stack.h"

namespace stackerr::core::error {

/**
 * @brief Capability of a node that carries a stack trace
 *
 * The merge step only needs a stack it can read and replace, so any node
 * type can take part by returning itself from ErrorNode::provenance().
 */
class StackCarrier {
public:
    virtual ~StackCarrier() = default;

    virtual const Stack& stack() const noexcept = 0;

    /**
     * @brief Swap in a new stack
     *
     * Not synchronised. Callers must not annotate the same error from
     * several threads at once.
     */
    virtual void replace_stack(Stack stack) = 0;
};

/**
 * @brief Error decorated with the call sites it passed through
 *
 * Transparent to chain traversal: the message is the underlying error's
 * message and the single cause is the underlying error. The stack only
 * shows up in the verbose rendering.
 */
class AnnotatedError : public ErrorNode, public StackCarrier {
public:
    AnnotatedError(Error underlying, Stack stack)
        : underlying_(std::move(underlying))
        , stack_(std::move(stack)) {
    }

    std::string message() const override { return underlying_.message(); }

    std::vector<Error> causes() const override { return {underlying_}; }

    StackCarrier* provenance() noexcept override { return this; }
    const StackCarrier* provenance() const noexcept override { return this; }

    const Stack& stack() const noexcept override { return stack_; }

    void replace_stack(Stack stack) override { stack_ = std::move(stack); }

    const Error& underlying() const noexcept { return underlying_; }

private:
    Error underlying_;
    Stack stack_;
};

namespace detail {

/**
 * @brief First node of the chain that carries a stack, absent if none
 */
Error find_stack_node(const Error& err);

} // namespace detail

/**
 * @brief Stack of the first stack-bearing node of the chain
 *
 * Empty when the chain carries no stack.
 */
Stack stack_of(const Error& err);

/**
 * @brief Check whether the chain carries a stack anywhere
 */
bool has_stack(const Error& err);

/**
 * @brief Construct-or-merge
 *
 * If the chain of `err` already has a stack-bearing node, `frames` are
 * prepended to its stack in place and that same node is returned.
 * Otherwise a new AnnotatedError wraps `err`. An absent `err` stays absent.
 */
Error new_with_stack(const Error& err, Stack frames);

/**
 * @brief Always allocate a new AnnotatedError around `underlying`
 *
 * The stack is `frames` followed by the existing stack of each source, in
 * order. Used by operations that build a new message object.
 */
Error annotate(Error underlying, Stack frames, const std::vector<Error>& sources);

} // namespace stackerr::core::error

#endif // CORE_ERROR_ANNOTATED_ERROR_H
