#include <eventual/result/types/error.hpp>

#include <wheels/core/assert.hpp>

namespace eventual {

namespace detail {

// Exception caught from user code, its type is only known to the runtime

class CapturedBox final : public IErrorBox {
 public:
  explicit CapturedBox(std::exception_ptr ex)
      : ex_(std::move(ex)),
        code_(make_error_code(Errc::Exception)) {
    try {
      std::rethrow_exception(ex_);
    } catch (const std::system_error& e) {
      code_ = e.code();
      message_ = e.what();
      view_ = &e;
    } catch (const std::exception& e) {
      message_ = e.what();
      view_ = &e;
    }
  }

  std::error_code Code() const override {
    return code_;
  }

  std::string Message() const override {
    return message_;
  }

  // ex_ keeps the object alive
  const std::exception* Exception() const override {
    return view_;
  }

  [[noreturn]] void Throw() const override {
    std::rethrow_exception(ex_);
  }

 private:
  std::exception_ptr ex_;
  std::error_code code_;
  std::string message_{};
  const std::exception* view_{nullptr};
};

}  // namespace detail

Error Error::FromException(std::exception_ptr ex) {
  WHEELS_VERIFY(ex != nullptr, "Empty exception_ptr");

  return Error(std::make_shared<const detail::CapturedBox>(std::move(ex)));
}

void Error::Throw() const {
  if (box_) {
    box_->Throw();
  }
  throw std::system_error(code_);
}

}  // namespace eventual
