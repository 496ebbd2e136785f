#pragma once

#include <eventual/result/errors/errc.hpp>

#include <concepts>
#include <exception>
#include <memory>
#include <string>
#include <system_error>
#include <type_traits>

namespace eventual {

namespace detail {

// Type-erased error payload

struct IErrorBox {
  virtual ~IErrorBox() = default;

  virtual std::error_code Code() const = 0;

  virtual std::string Message() const = 0;

  // nullptr if the payload carries no exception object
  virtual const std::exception* Exception() const = 0;

  [[noreturn]] virtual void Throw() const = 0;
};

template <typename E>
class ExceptionBox final : public IErrorBox {
 public:
  explicit ExceptionBox(E ex)
      : ex_(std::move(ex)) {
  }

  std::error_code Code() const override {
    if constexpr (std::is_base_of_v<std::system_error, E>) {
      return ex_.code();
    } else {
      return make_error_code(Errc::Exception);
    }
  }

  std::string Message() const override {
    return ex_.what();
  }

  const std::exception* Exception() const override {
    return &ex_;
  }

  [[noreturn]] void Throw() const override {
    throw ex_;
  }

 private:
  E ex_;
};

}  // namespace detail

// Any error value: a bare std::error_code or a boxed exception object.
// Immutable, cheap to copy

class Error {
 public:
  Error(std::error_code code)  // NOLINT
      : code_(code) {
  }

  Error(Errc code)  // NOLINT
      : code_(make_error_code(code)) {
  }

  // Boxes a copy of the exception, keeping its dynamic type
  template <typename E>
  requires std::derived_from<std::decay_t<E>, std::exception>
  Error(E&& ex)  // NOLINT
      : box_(std::make_shared<const detail::ExceptionBox<std::decay_t<E>>>(
            std::forward<E>(ex))),
        code_(box_->Code()) {
  }

  // Exception must derive from std::exception
  static Error FromException(std::exception_ptr ex);

  static Error FromCurrentException() {
    return FromException(std::current_exception());
  }

  std::error_code Code() const {
    return code_;
  }

  std::string Message() const {
    return box_ ? box_->Message() : code_.message();
  }

  bool IsBoxed() const {
    return box_ != nullptr;
  }

  // Typed inspection of the boxed exception, nullptr on mismatch
  template <typename E>
  const E* As() const {
    if (!box_) {
      return nullptr;
    }
    return dynamic_cast<const E*>(box_->Exception());
  }

  [[noreturn]] void Throw() const;

  // Identity: same box or same bare code
  bool operator==(const Error& that) const {
    if (box_ || that.box_) {
      return box_ == that.box_;
    }
    return code_ == that.code_;
  }

  bool operator==(std::error_code code) const {
    return code_ == code;
  }

  bool operator==(Errc code) const {
    return code_ == make_error_code(code);
  }

 private:
  explicit Error(std::shared_ptr<const detail::IErrorBox> box)
      : box_(std::move(box)),
        code_(box_->Code()) {
  }

 private:
  std::shared_ptr<const detail::IErrorBox> box_{};
  std::error_code code_;
};

}  // namespace eventual
