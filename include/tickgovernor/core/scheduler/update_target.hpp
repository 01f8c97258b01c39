#pragma once

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace TickGovernor {

/**
 * @class UpdateTarget
 * @brief The single operation the batch scheduler invokes.
 *
 * Consumer objects either implement this directly or are wrapped by one of
 * the legacy adapters below. The scheduler holds targets weakly and calls
 * isValid() before every update(); invalid targets are skipped and counted.
 */
class UpdateTarget {
public:
    virtual ~UpdateTarget() = default;

    virtual void update() = 0;

    // False when the wrapped object is gone or exposes no update capability
    virtual bool isValid() const { return true; }

    virtual const char* name() const { return "UpdateTarget"; }
};

using UpdateTargetPtr = std::shared_ptr<UpdateTarget>;

// ============================================================================
// Legacy capability adapters
// ============================================================================
// Each holds the wrapped object weakly so an expired object makes the
// adapter invalid instead of keeping the object alive.
// ============================================================================

template <typename T>
class FullUpdateAdapter : public UpdateTarget {
public:
    explicit FullUpdateAdapter(std::weak_ptr<T> obj) : obj_(std::move(obj)) {}

    void update() override {
        if (auto o = obj_.lock()) o->updateAll();
    }
    bool isValid() const override { return !obj_.expired(); }
    const char* name() const override { return "FullUpdateAdapter"; }

private:
    std::weak_ptr<T> obj_;
};

template <typename T>
class PartialUpdateAdapter : public UpdateTarget {
public:
    explicit PartialUpdateAdapter(std::weak_ptr<T> obj) : obj_(std::move(obj)) {}

    void update() override {
        if (auto o = obj_.lock()) o->update();
    }
    bool isValid() const override { return !obj_.expired(); }
    const char* name() const override { return "PartialUpdateAdapter"; }

private:
    std::weak_ptr<T> obj_;
};

template <typename T>
class ElementUpdateAdapter : public UpdateTarget {
public:
    static constexpr const char* DEFAULT_REASON = "TickGovernor_Pending";

    explicit ElementUpdateAdapter(std::weak_ptr<T> obj, std::string reason = DEFAULT_REASON)
        : obj_(std::move(obj)), reason_(std::move(reason)) {}

    void update() override {
        if (auto o = obj_.lock()) o->updateAllElements(reason_);
    }
    bool isValid() const override { return !obj_.expired(); }
    const char* name() const override { return "ElementUpdateAdapter"; }

private:
    std::weak_ptr<T> obj_;
    std::string reason_;
};

template <typename T>
class HealthPowerUpdateAdapter : public UpdateTarget {
public:
    explicit HealthPowerUpdateAdapter(std::weak_ptr<T> obj) : obj_(std::move(obj)) {}

    void update() override {
        if (auto o = obj_.lock()) {
            o->updateHealth();
            o->updatePower();
        }
    }
    bool isValid() const override { return !obj_.expired(); }
    const char* name() const override { return "HealthPowerUpdateAdapter"; }

private:
    std::weak_ptr<T> obj_;
};

/**
 * @class CallbackUpdateTarget
 * @brief Target backed by a function; invalid when the function is empty
 */
class CallbackUpdateTarget : public UpdateTarget {
public:
    explicit CallbackUpdateTarget(std::function<void()> fn, const char* name = "CallbackUpdateTarget")
        : fn_(std::move(fn)), name_(name) {}

    void update() override { fn_(); }
    bool isValid() const override { return static_cast<bool>(fn_); }
    const char* name() const override { return name_; }

private:
    std::function<void()> fn_;
    const char* name_;
};

// ============================================================================
// Capability detection
// ============================================================================

namespace detail {

template <typename T, typename = void>
struct has_update_all : std::false_type {};
template <typename T>
struct has_update_all<T, std::void_t<decltype(std::declval<T&>().updateAll())>> : std::true_type {};

template <typename T, typename = void>
struct has_update : std::false_type {};
template <typename T>
struct has_update<T, std::void_t<decltype(std::declval<T&>().update())>> : std::true_type {};

template <typename T, typename = void>
struct has_update_all_elements : std::false_type {};
template <typename T>
struct has_update_all_elements<T, std::void_t<decltype(
    std::declval<T&>().updateAllElements(std::declval<const std::string&>()))>> : std::true_type {};

template <typename T, typename = void>
struct has_health_power : std::false_type {};
template <typename T>
struct has_health_power<T, std::void_t<decltype(std::declval<T&>().updateHealth()),
                                       decltype(std::declval<T&>().updatePower())>> : std::true_type {};

} // namespace detail

/**
 * @brief Wrap a legacy object in the adapter matching its first capability:
 * updateAll(), update(), updateAllElements(reason), updateHealth()+updatePower()
 */
template <typename T>
UpdateTargetPtr makeUpdateTarget(const std::shared_ptr<T>& obj) {
    if constexpr (std::is_base_of_v<UpdateTarget, T>) {
        return obj;
    } else if constexpr (detail::has_update_all<T>::value) {
        return std::make_shared<FullUpdateAdapter<T>>(obj);
    } else if constexpr (detail::has_update<T>::value) {
        return std::make_shared<PartialUpdateAdapter<T>>(obj);
    } else if constexpr (detail::has_update_all_elements<T>::value) {
        return std::make_shared<ElementUpdateAdapter<T>>(obj);
    } else if constexpr (detail::has_health_power<T>::value) {
        return std::make_shared<HealthPowerUpdateAdapter<T>>(obj);
    } else {
        static_assert(detail::has_update_all<T>::value,
                      "type exposes no recognized update capability");
        return nullptr;
    }
}

} // namespace TickGovernor
