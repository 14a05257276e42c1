/*
 * macro.h
 *
 * Class-shape macros shared by the ringview headers.
 */

#ifndef RINGVIEW_MACRO_H_
#define RINGVIEW_MACRO_H_

// Helper macro for deleting copy/move operations.
// Objects that hand out `this` to a subscription list must not relocate.
#define RINGVIEW_DELETE_COPY_MOVE(ClassName)            \
    ClassName(const ClassName&) = delete;               \
    ClassName& operator=(const ClassName&) = delete;    \
    ClassName(ClassName&&) = delete;                    \
    ClassName& operator=(ClassName&&) = delete;         \
    static_assert(true, "Require semicolon after macro")

/**
 * @brief Turns a class into a process-wide singleton.
 * @param ClassName - Class name
 * @param ... Additional specifiers for the constructor
 *
 * Works inside class templates: every instantiation gets its own instance.
 * The class must derive from a base with a virtual destructor.
 *
 * Example of use:
 * template <class T>
 * class null_policy final : public policy_base<T> {
 *     RINGVIEW_SINGLETON(null_policy, = default);
 * };
 */
#define RINGVIEW_SINGLETON(ClassName, ...)              \
private:                                                \
    ClassName() __VA_ARGS__;                            \
public:                                                 \
    ~ClassName() override = default;                    \
    RINGVIEW_DELETE_COPY_MOVE(ClassName);               \
    static ClassName& instance() noexcept {             \
        static ClassName instance;                      \
        return instance;                                \
    }                                                   \
private:                                                \
    static_assert(true, "Require semicolon after macro")

#endif /* RINGVIEW_MACRO_H_ */
