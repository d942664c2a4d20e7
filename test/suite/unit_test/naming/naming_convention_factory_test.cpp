/* resname: Resource naming
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

#include "resname/naming/naming_convention_factory.hpp"
#include "resname/naming/error.hpp"
#include "resname/test/test_logger.hpp"
#include "resname/test/test_suffix_source.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <sstream>

namespace resname::naming::test
{

namespace
{
using resname::test::Test_logger;
using resname::test::Test_suffix_source;
} // Anonymous namespace

TEST(Naming_convention_factory, Default_config)
{
  Test_logger logger;
  const Naming_convention_factory factory(&logger);
  EXPECT_EQ(factory.config().m_prefix, Naming_config::S_DEFAULT_PREFIX);

  const auto convention = factory.create();
  ASSERT_TRUE(convention);
  EXPECT_EQ(convention->shared_name_for_group("mycluster"), "resname-mycluster");
  EXPECT_EQ(convention->extract_group(convention->unique_name_for_group("mycluster")), "mycluster");
}

TEST(Naming_convention_factory, Without_prefix)
{
  Test_logger logger;
  Naming_config config;
  config.m_prefix = "jclouds";
  const Naming_convention_factory factory(&logger, config, Test_suffix_source::create({ "f3e" }));

  const auto convention = factory.create_without_prefix();
  ASSERT_TRUE(convention);
  EXPECT_EQ(convention->shared_name_for_group("mycluster"), "mycluster");
  EXPECT_EQ(convention->unique_name_for_group("mycluster"), "mycluster-f3e");
  EXPECT_EQ(convention->group_in_shared_name_or_none("mycluster"), "mycluster");
  EXPECT_EQ(convention->group_in_unique_name_or_none("mycluster-f3e"), "mycluster");
  EXPECT_EQ(convention->extract_group("mycluster-f3e"), "mycluster");
  EXPECT_TRUE(convention->contains_group("mycluster")("mycluster"));

  // Prefixed names are not decoded as such: the "prefix" is simply part of the group.
  EXPECT_EQ(convention->group_in_shared_name_or_none("jclouds-mycluster"), "jclouds-mycluster");
  EXPECT_FALSE(convention->contains_group("mycluster")("jclouds-mycluster"));

  std::ostringstream os;
  os << *convention;
  EXPECT_EQ(os.str(), "Delimited_naming_convention[prefix[] delimiter[-]]");
}

/// Both flavors draw from the one injected source.
TEST(Naming_convention_factory, Shared_suffix_source)
{
  Test_logger logger;
  const auto source = Test_suffix_source::create({ "001", "002" });
  const Naming_convention_factory factory(&logger, Naming_config(), source);

  const auto with = factory.create();
  const auto without = factory.create_without_prefix();
  EXPECT_EQ(with->unique_name_for_group("g"), "resname-g-001");
  EXPECT_EQ(without->unique_name_for_group("g"), "g-002");
  EXPECT_EQ(source->n_calls(), 2u);
}

TEST(Naming_convention_factory, Invalid_config)
{
  Test_logger logger;
  Naming_config config;

  config.m_delimiter = 'x';
  EXPECT_THROW(Naming_convention_factory(&logger, config), flow::error::Runtime_error);

  config = Naming_config();
  config.m_prefix = "my prefix";
  try
  {
    const Naming_convention_factory factory(&logger, config);
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_CONFIG_PREFIX_INVALID);
  }

  config = Naming_config();
  config.m_suffix_alphabet = "abca";
  EXPECT_THROW(Naming_convention_factory(nullptr, config), flow::error::Runtime_error);
}

/// Created conventions do not depend on the factory staying around; nor does logging need a Logger.
TEST(Naming_convention_factory, Lifetimes)
{
  Group_naming_convention::Ptr convention;
  {
    Naming_config config;
    config.m_delimiter = '#';
    config.m_suffix_length = 4;
    config.m_suffix_alphabet = "ABCD";
    const Naming_convention_factory factory(nullptr, config);
    convention = factory.create();
  }

  EXPECT_EQ(convention->shared_name_for_group("mycluster"), "resname#mycluster");
  const auto unique = convention->unique_name_for_group("mycluster");
  EXPECT_EQ(unique.size(), std::string("resname#mycluster#ABCD").size());
  EXPECT_EQ(convention->group_in_unique_name_or_none(unique), "mycluster");
  EXPECT_TRUE(convention->contains_any_group()(unique));
}

TEST(Naming_convention_factory, Print)
{
  const Naming_convention_factory factory(nullptr);
  std::ostringstream os;
  os << factory;
  EXPECT_EQ(os.str().find("[prefix[resname] delimiter[-] suffix[3 x 0123456789abcdef]]@"), 0u);
}

} // namespace resname::naming::test
