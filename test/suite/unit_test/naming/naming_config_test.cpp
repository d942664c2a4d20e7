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

#include "resname/naming/naming_config.hpp"
#include "resname/naming/error.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <sstream>

namespace resname::naming::test
{

TEST(Naming_config, Defaults)
{
  const Naming_config config;
  EXPECT_EQ(config.m_prefix, "resname");
  EXPECT_EQ(config.m_delimiter, '-');
  EXPECT_EQ(config.m_suffix_length, 3u);
  EXPECT_EQ(config.m_suffix_alphabet, "0123456789abcdef");

  Error_code err_code = error::Code::S_GROUP_EMPTY; // Must get cleared.
  validate_naming_config(config, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_NO_THROW(validate_naming_config(config));
}

TEST(Naming_config, Delimiter)
{
  Error_code err_code;
  Naming_config config;

  for (const char bad : { ' ', 'a', 'Z', '5', '\n', '\t', '\x7f', '\0' })
  {
    config.m_delimiter = bad;
    validate_naming_config(config, &err_code);
    EXPECT_EQ(err_code, error::Code::S_CONFIG_DELIMITER_INVALID) << "Delimiter code [" << int(bad) << "].";
  }
  for (const char good : { '-', '_', '#', '.', '~', '!' })
  {
    config.m_delimiter = good;
    validate_naming_config(config, &err_code);
    EXPECT_FALSE(err_code) << "Delimiter [" << good << "].";
  }
}

TEST(Naming_config, Prefix)
{
  Error_code err_code;
  Naming_config config;

  for (const char* good : { "", "jclouds", "my-app", "A1" })
  {
    config.m_prefix = good;
    validate_naming_config(config, &err_code);
    EXPECT_FALSE(err_code) << "Prefix [" << good << "].";
  }
  for (const char* bad : { "my app", "my_app", "app/", "caf\xc3\xa9" })
  {
    config.m_prefix = bad;
    validate_naming_config(config, &err_code);
    EXPECT_EQ(err_code, error::Code::S_CONFIG_PREFIX_INVALID) << "Prefix [" << bad << "].";
  }
}

TEST(Naming_config, Suffix)
{
  Error_code err_code;
  Naming_config config;

  config.m_suffix_length = 0;
  validate_naming_config(config, &err_code);
  EXPECT_EQ(err_code, error::Code::S_CONFIG_SUFFIX_LENGTH_INVALID);
  config.m_suffix_length = 4;

  for (const char* bad : { "", "ab-", "aab", "abc ", "0123456789abcdef0" })
  {
    config.m_suffix_alphabet = bad;
    validate_naming_config(config, &err_code);
    EXPECT_EQ(err_code, error::Code::S_CONFIG_SUFFIX_ALPHABET_INVALID) << "Alphabet [" << bad << "].";
  }
  for (const char* good : { "a", "ABCabc", "0123456789" })
  {
    config.m_suffix_alphabet = good;
    validate_naming_config(config, &err_code);
    EXPECT_FALSE(err_code) << "Alphabet [" << good << "].";
  }
}

/// The first problem found (delimiter, then prefix, then suffix) is reported; null `err_code` means throw.
TEST(Naming_config, Order_and_throw)
{
  Naming_config config;
  config.m_delimiter = ' ';
  config.m_prefix = "bad prefix";
  config.m_suffix_length = 0;

  Error_code err_code;
  validate_naming_config(config, &err_code);
  EXPECT_EQ(err_code, error::Code::S_CONFIG_DELIMITER_INVALID);
  config.m_delimiter = '-';
  validate_naming_config(config, &err_code);
  EXPECT_EQ(err_code, error::Code::S_CONFIG_PREFIX_INVALID);
  config.m_prefix.clear();
  validate_naming_config(config, &err_code);
  EXPECT_EQ(err_code, error::Code::S_CONFIG_SUFFIX_LENGTH_INVALID);

  try
  {
    validate_naming_config(config);
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_CONFIG_SUFFIX_LENGTH_INVALID);
  }
}

TEST(Naming_config, Print)
{
  std::ostringstream os;
  os << Naming_config();
  EXPECT_EQ(os.str(), "prefix[resname] delimiter[-] suffix[3 x 0123456789abcdef]");
}

} // namespace resname::naming::test
