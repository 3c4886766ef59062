// Beans.cpp - tests for getter/setter types and accessor flags

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Transform/Transform.hpp>

#include <string>

namespace BeanDemo {
using NGIN::Transform::ShapeBuilder;
using NGIN::Transform::Tag;

struct User {
  std::string name;
  int age{0};
  bool active{false};
  friend void NginShape(Tag<User>, ShapeBuilder<User> &b) { b.Fields<&User::name, &User::age, &User::active>(); }
};

class UserBean {
public:
  const std::string &GetName() const { return m_name; }
  void SetName(std::string name) { m_name = std::move(name); }
  int GetAge() const { return m_age; }
  void SetAge(int age) { m_age = age; }
  bool IsActive() const { return m_active; }
  void SetActive(bool active) { m_active = active; }

  friend void NginShape(Tag<UserBean>, ShapeBuilder<UserBean> &b) {
    b.Getter<&UserBean::GetName>()
        .Getter<&UserBean::GetAge>()
        .Getter<&UserBean::IsActive>()
        .Setter<&UserBean::SetName>()
        .Setter<&UserBean::SetAge>()
        .Setter<&UserBean::SetActive>();
  }

private:
  std::string m_name;
  int m_age{0};
  bool m_active{false};
};

class Account {
public:
  Account(std::string owner, long balance) : m_owner(std::move(owner)), m_balance(balance) {}
  const std::string &owner() const { return m_owner; }
  long balance() const { return m_balance; }
  friend void NginShape(Tag<Account>, ShapeBuilder<Account> &b) {
    b.Accessor<&Account::owner>().Accessor<&Account::balance>().Constructor<std::string, long>("owner", "balance");
  }

private:
  std::string m_owner;
  long m_balance;
};

struct AccountDto {
  std::string owner;
  long balance{0};
  friend void NginShape(Tag<AccountDto>, ShapeBuilder<AccountDto> &b) { b.Fields<&AccountDto::owner, &AccountDto::balance>(); }
};

class Receipt {
public:
  int GetTotal() const { return 10; }
  friend void NginShape(Tag<Receipt>, ShapeBuilder<Receipt> &b) { b.Getter<&Receipt::GetTotal>(); }
};

struct Total {
  int total{0};
  friend void NginShape(Tag<Total>, ShapeBuilder<Total> &b) { b.Fields<&Total::total>(); }
};
} // namespace BeanDemo

TEST_CASE("RecordToBeanUsesSetters", "[transform][Beans]") {
  using namespace NGIN::Transform;
  using namespace BeanDemo;

  auto built = Define<User, UserBean>().Build();
  REQUIRE(built.has_value());
  CHECK(DescribePlan(built->Plan()) == "BeanSetters(copy name, copy age, copy active)");

  const UserBean bean = built->Transform(User{"kim", 41, true});
  CHECK(bean.GetName() == "kim");
  CHECK(bean.GetAge() == 41);
  CHECK(bean.IsActive());
}

TEST_CASE("BeanToRecordUsesGetters", "[transform][Beans]") {
  using namespace NGIN::Transform;
  using namespace BeanDemo;

  UserBean bean;
  bean.SetName("lee");
  bean.SetAge(30);

  auto built = Define<UserBean, User>().Build();
  REQUIRE(built.has_value());
  const User user = built->Transform(bean);
  CHECK(user.name == "lee");
  CHECK(user.age == 30);
  CHECK_FALSE(user.active);
}

TEST_CASE("DisabledBeanFlagsBlockDerivation", "[transform][Beans]") {
  using namespace NGIN::Transform;
  using namespace BeanDemo;

  auto noGetters = Define<UserBean, User>().EnableBeanGetters(false).Build();
  REQUIRE_FALSE(noGetters.has_value());
  CHECK(noGetters.error().Size() == 3);
  CHECK(noGetters.error().Contains(".name", FailureReason::NoMatchingMember));

  auto noSetters = Define<User, UserBean>().EnableBeanSetters(false).Build();
  REQUIRE_FALSE(noSetters.has_value());
  CHECK(noSetters.error().Contains(FailureReason::NoAccessibleConstructor));
}

TEST_CASE("MethodAccessorsCanBeDisabled", "[transform][Beans]") {
  using namespace NGIN::Transform;
  using namespace BeanDemo;

  auto built = Define<Account, AccountDto>().Build();
  REQUIRE(built.has_value());
  const AccountDto dto = built->Transform(Account{"joy", 250});
  CHECK(dto.owner == "joy");
  CHECK(dto.balance == 250);

  auto back = Define<AccountDto, Account>().Build();
  REQUIRE(back.has_value());
  CHECK(back->Transform(dto).balance() == 250);

  auto blocked = Define<Account, AccountDto>().EnableMethodAccessors(false).Build();
  REQUIRE_FALSE(blocked.has_value());
  CHECK(blocked.error().Contains(".owner", FailureReason::NoMatchingMember));
  CHECK(blocked.error().Contains(".balance", FailureReason::NoMatchingMember));
}

TEST_CASE("ReadOnlyTargetHasNoConstructor", "[transform][Beans]") {
  using namespace NGIN::Transform;
  using namespace BeanDemo;

  auto built = Define<Total, Receipt>().Build();
  REQUIRE_FALSE(built.has_value());
  CHECK(built.error().Contains("", FailureReason::NoAccessibleConstructor));

  auto read = Define<Receipt, Total>().Build();
  REQUIRE(read.has_value());
  CHECK(read->Transform(Receipt{}).total == 10);
}
