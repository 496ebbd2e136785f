#include <eventual/threads/lockfull/guarded.hpp>

#include <wheels/test/framework.hpp>

#include <string>
#include <vector>

using namespace eventual;  // NOLINT

TEST_SUITE(Guarded) {
  SIMPLE_TEST(ReadWrite) {
    threads::lockfull::Guarded<int> cell{1};

    ASSERT_EQ(cell.Read(), 1);

    cell.Write(2);

    ASSERT_EQ(cell.Read(), 2);
  }

  SIMPLE_TEST(With) {
    threads::lockfull::Guarded<std::vector<std::string>> cell{};

    cell.With([](std::vector<std::string>& names) {
      names.push_back("first");
      names.push_back("second");
    });

    auto size = cell.With([](std::vector<std::string>& names) {
      return names.size();
    });

    ASSERT_EQ(size, 2);
    ASSERT_EQ(cell.Read().back(), "second");
  }
}

RUN_ALL_TESTS()
