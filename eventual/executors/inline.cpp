#include <eventual/executors/inline.hpp>

namespace eventual::executors {

class InlineExecutor : public IExecutor {
 public:
  // IExecutor
  void Submit(Task* task) override {
    task->Run();
  }
};

IExecutor& Inline() {
  static InlineExecutor instance;
  return instance;
}

}  // namespace eventual::executors
