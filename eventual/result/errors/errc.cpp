#include <eventual/result/errors/errc.hpp>

namespace eventual {

namespace {

class Category : public std::error_category {
 public:
  const char* name() const noexcept override {
    return "eventual";
  }

  std::string message(int code) const override {
    switch (static_cast<Errc>(code)) {
      case Errc::NoSuchElement:
        return "no such element";
      case Errc::TimedOut:
        return "timed out";
      case Errc::BrokenPromise:
        return "broken promise";
      case Errc::Exception:
        return "exception";
    }
    return "unknown error";
  }
};

}  // namespace

const std::error_category& ErrorCategory() {
  static Category instance;
  return instance;
}

std::error_code make_error_code(Errc code) {  // NOLINT
  return {static_cast<int>(code), ErrorCategory()};
}

}  // namespace eventual
