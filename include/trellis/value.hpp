#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

namespace trellis {

// Type-erased, shared fixture or parameter value. Copies share the same
// object, so two consumers of one fixture instance observe one address.
class Value {
public:
    Value() = default;

    template<typename T>
    static Value of(T val) {
        Value v;
        v.ptr_ = std::make_shared<T>(std::move(val));
        v.type_ = &typeid(T);
        return v;
    }

    bool empty() const { return ptr_ == nullptr; }
    const std::type_info& type() const { return type_ ? *type_ : typeid(void); }
    const void* address() const { return ptr_.get(); }

    template<typename T>
    T* get_if() const {
        if (!ptr_ || *type_ != typeid(T)) return nullptr;
        return static_cast<T*>(ptr_.get());
    }

    bool same_instance(const Value& o) const { return ptr_ == o.ptr_; }

private:
    std::shared_ptr<void> ptr_;
    const std::type_info* type_ = nullptr;
};

// Identifies the invocation a fixture is being set up for.
struct RequestInfo {
    std::string invocation_id;   // "test_add[1-2]"
    std::string test_name;       // "test_add"
    std::string location;        // test file
    std::string param_id;        // "1-2", empty when not parametrized
};

// Ordered name -> value mapping handed to fixture and test bodies.
class Arguments {
public:
    void set(const std::string& name, Value value);
    bool has(const std::string& name) const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Throws std::out_of_range for an unknown name.
    const Value& raw(const std::string& name) const;

    // Throws std::out_of_range for an unknown name and std::invalid_argument
    // when the stored value is not a T.
    template<typename T>
    T& get(const std::string& name) const {
        T* p = raw(name).template get_if<T>();
        if (!p) {
            throw std::invalid_argument("argument '" + name +
                "' does not hold the requested type");
        }
        return *p;
    }

    std::vector<std::string> names() const;

    const RequestInfo* request() const { return request_; }
    void set_request(const RequestInfo* info) { request_ = info; }

    // Adds every entry of other that is not already present.
    void merge(const Arguments& other);

private:
    std::vector<std::pair<std::string, Value>> entries_;
    const RequestInfo* request_ = nullptr;
};

} // namespace trellis
