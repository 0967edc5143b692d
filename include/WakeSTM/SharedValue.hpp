#pragma once

#include <memory>
#include <string>
#include <typeinfo>
#include <type_traits>
#include <utility>

namespace WakeSTM {

// 类型不匹配说明上层 (事务管理器) 用错了 Var 的类型，不是可恢复的运行时错误
class BadValueCast : public std::bad_cast {
public:
    BadValueCast(const char* expected, const char* actual)
        : msg_(std::string("WakeSTM::SharedValue: expected ") + expected + ", holds " + actual)
    {}

    const char* what() const noexcept override {
        return msg_.c_str();
    }

private:
    std::string msg_;
};

namespace detail {

// 为了让 LogEntry 可以统一存放不同类型的值
struct ValueBase {
    virtual ~ValueBase() = default;
    virtual const std::type_info& type() const noexcept = 0;
};

template<typename T>
struct ValueHolder final : ValueBase {
    const T payload;

    template<typename... Args>
    explicit ValueHolder(Args&&... args)
        : payload(std::forward<Args>(args)...)
    {}

    ValueHolder(const ValueHolder&) = delete;
    ValueHolder& operator=(const ValueHolder&) = delete;

    const std::type_info& type() const noexcept override {
        return typeid(T);
    }
};

}

// 引用计数的只读值句柄。拷贝句柄只增加引用计数，不拷贝 payload；
// 值一旦发布就不再修改，更新时替换整个句柄。
class SharedValue {
public:
    SharedValue() = default;

    template<typename T, typename... Args>
    static SharedValue make(Args&&... args) {
        using U = std::decay_t<T>;
        return SharedValue(std::make_shared<detail::ValueHolder<U>>(std::forward<Args>(args)...));
    }

    template<typename T>
    static SharedValue of(T&& val) {
        return make<std::decay_t<T>>(std::forward<T>(val));
    }

    // 带检查的向下转型，类型不符直接抛异常
    template<typename T>
    const T& get() const {
        const T* p = tryGet<T>();
        if (!p) {
            throw BadValueCast(typeid(T).name(), ptr_ ? ptr_->type().name() : "<empty>");
        }
        return *p;
    }

    template<typename T>
    const T* tryGet() const noexcept {
        if (!ptr_ || ptr_->type() != typeid(T)) return nullptr;
        return &static_cast<const detail::ValueHolder<T>*>(ptr_.get())->payload;
    }

    template<typename T>
    bool holds() const noexcept {
        return ptr_ && ptr_->type() == typeid(T);
    }

    const std::type_info& type() const noexcept {
        return ptr_ ? ptr_->type() : typeid(void);
    }

    // 同一个句柄 (指向同一份 payload)，不比较值
    bool sameHandle(const SharedValue& other) const noexcept {
        return ptr_ == other.ptr_;
    }

    long useCount() const noexcept {
        return ptr_.use_count();
    }

    explicit operator bool() const noexcept {
        return ptr_ != nullptr;
    }

private:
    explicit SharedValue(std::shared_ptr<const detail::ValueBase> ptr)
        : ptr_(std::move(ptr))
    {}

    std::shared_ptr<const detail::ValueBase> ptr_;
};

}
