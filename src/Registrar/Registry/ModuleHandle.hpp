#pragma once

#include "RegistryError.hpp"

namespace Registrar::Registry {

/**
 * @class ModuleHandle
 * @brief Owning, type-erased box around one constructed module instance
 *
 * A handle remembers the interface type it was boxed as. The only way back
 * to a typed pointer is a checked narrowing: take<Interface>() transfers
 * ownership when Interface matches, and returns TypeMismatch otherwise while
 * leaving the handle intact. No implicit conversion to a related type is
 * attempted; a handle boxed as Plugin cannot be taken as Module.
 *
 * Example:
 *   auto handle = ModuleHandle::make<Plugin>(std::make_unique<EchoPlugin>());
 *   auto plugin = std::move(handle).take<Plugin>();
 *   if (plugin) {
 *       (*plugin)->execute("hi");
 *   }
 */
class REGISTRAR_API ModuleHandle {
public:
    ModuleHandle() = default;
    ~ModuleHandle() = default;

    ModuleHandle(const ModuleHandle&) = delete;
    ModuleHandle& operator=(const ModuleHandle&) = delete;

    ModuleHandle(ModuleHandle&& other) noexcept
        : m_object(std::exchange(other.m_object, Storage { nullptr, &discard }))
        , m_type(std::exchange(other.m_type, std::type_index(typeid(void))))
    {
    }

    ModuleHandle& operator=(ModuleHandle&& other) noexcept
    {
        if (this != &other) {
            m_object = std::exchange(other.m_object, Storage { nullptr, &discard });
            m_type = std::exchange(other.m_type, std::type_index(typeid(void)));
        }
        return *this;
    }

    /**
     * @brief Box an instance behind the Interface it will be requested as
     * @tparam Interface Type callers pass to take<>()
     * @param instance Implementation; ownership moves into the handle
     * @return Handle, empty when instance is null
     */
    template <typename Interface, typename Impl>
        requires ImplementationOf<Impl, Interface>
    static ModuleHandle make(std::unique_ptr<Impl> instance)
    {
        static_assert(std::is_same_v<Impl, Interface> || std::has_virtual_destructor_v<Interface>,
            "Interface must have a virtual destructor to own a derived implementation");

        ModuleHandle handle;
        if (!instance) {
            return handle;
        }

        Interface* object = instance.release();
        handle.m_object = Storage { object, [](void* p) { delete static_cast<Interface*>(p); } };
        handle.m_type = std::type_index(typeid(Interface));
        return handle;
    }

    /**
     * @brief Transfer ownership out as Interface
     * @return The instance, TypeMismatch when boxed as another type,
     *         InvalidArgument when the handle is empty
     */
    template <typename Interface>
    [[nodiscard]] std::expected<std::unique_ptr<Interface>, RegistryError> take() &&
    {
        if (empty()) {
            return std::unexpected(RegistryError { ErrorCode::InvalidArgument, {}, "module handle is empty" });
        }

        if (!holds<Interface>()) {
            return std::unexpected(RegistryError {
                ErrorCode::TypeMismatch, {},
                "requested interface '" + std::string(typeid(Interface).name())
                    + "' but handle holds '" + type_name() + "'" });
        }

        return std::unique_ptr<Interface>(static_cast<Interface*>(m_object.release()));
    }

    /**
     * @brief Borrow the instance as Interface without taking ownership
     * @return Pointer, or nullptr when empty or boxed as another type
     */
    template <typename Interface>
    [[nodiscard]] Interface* peek() const
    {
        if (empty() || !holds<Interface>()) {
            return nullptr;
        }
        return static_cast<Interface*>(m_object.get());
    }

    template <typename Interface>
    [[nodiscard]] bool holds() const
    {
        return m_type == std::type_index(typeid(Interface));
    }

    [[nodiscard]] bool empty() const { return m_object == nullptr; }

    explicit operator bool() const { return !empty(); }

    [[nodiscard]] std::type_index type() const { return m_type; }

    [[nodiscard]] std::string type_name() const { return empty() ? "<empty>" : m_type.name(); }

private:
    using Storage = std::unique_ptr<void, void (*)(void*)>;

    static void discard(void*) { }

    Storage m_object { nullptr, &discard };
    std::type_index m_type { typeid(void) };
};

} // namespace Registrar::Registry
