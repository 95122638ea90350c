#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstdint>
#include <cstring>
#include <vector>

#include "doctest.h"
#include "input_builder.hpp"
#include "mock_host.h"
#include "tally/errors.hpp"
#include "tally/panic.h"
#include "tally/program_api.h"

static TestAccount counter_account(tally_u32 count)
{
  TestAccount a;
  a.key_byte = 0x11;
  a.owner_byte = 0x22;
  a.lamports = 890880;
  a.data = {static_cast<std::uint8_t>(count & 0xFF), static_cast<std::uint8_t>((count >> 8) & 0xFF),
            static_cast<std::uint8_t>((count >> 16) & 0xFF),
            static_cast<std::uint8_t>((count >> 24) & 0xFF)};
  return a;
}

static tally_u32 stored_count(const TallyAccountInfo &acc)
{
  TallyCounterState st{};
  REQUIRE(tally_state_decode(acc.data, acc.data_len, &st) == 0);
  return st.count;
}

/* ------------------------------------------------------------------------- */
/* Input decoding                                                            */
/* ------------------------------------------------------------------------- */
TEST_CASE("decode a single account input")
{
  TestAccount a = counter_account(10);
  a.is_signer = true;
  a.rent_epoch = 361;
  std::vector<std::uint8_t> buf =
      InputBuilder().account(a).instruction({0x00, 0x05, 0x00, 0x00, 0x00}).program_id_byte(0x33).build();

  TallyInput in;
  REQUIRE(tally_deserialize_input(buf.data(), buf.size(), &in) == 0);
  REQUIRE(in.account_count == 1);

  const TallyAccountInfo &acc = in.accounts[0];
  CHECK(acc.key->x[0] == 0x11);
  CHECK(acc.key->x[31] == 0x11);
  CHECK(acc.owner->x[0] == 0x22);
  CHECK(*acc.lamports == 890880u);
  CHECK(acc.data_len == 4);
  CHECK(stored_count(acc) == 10u);
  CHECK(acc.is_signer);
  CHECK(acc.is_writable);
  CHECK_FALSE(acc.executable);
  CHECK(acc.rent_epoch == 361u);
  CHECK(acc.borrow_state == 0);
  CHECK(acc.dup_of == nullptr);

  CHECK(in.data_len == 5);
  CHECK(in.data[0] == 0x00);
  CHECK(in.data[1] == 0x05);
  CHECK(in.program_id->x[0] == 0x33);

  // Handles point into the buffer
  CHECK(acc.data >= buf.data());
  CHECK(acc.data < buf.data() + buf.size());
}

TEST_CASE("decode an input without accounts")
{
  std::vector<std::uint8_t> buf = InputBuilder().instruction({0x01, 0, 0, 0, 0}).build();

  TallyInput in;
  REQUIRE(tally_deserialize_input(buf.data(), buf.size(), &in) == 0);
  CHECK(in.account_count == 0);
  CHECK(in.data_len == 5);
}

TEST_CASE("odd data lengths are padded to 8 bytes")
{
  TestAccount odd;
  odd.data = {1, 2, 3};
  TestAccount second = counter_account(77);
  std::vector<std::uint8_t> buf = InputBuilder().account(odd).account(second).build();

  TallyInput in;
  REQUIRE(tally_deserialize_input(buf.data(), buf.size(), &in) == 0);
  REQUIRE(in.account_count == 2);
  CHECK(in.accounts[0].data_len == 3);
  CHECK(in.accounts[0].data[2] == 3);
  CHECK(stored_count(in.accounts[1]) == 77u);
  CHECK(in.data_len == 0);
}

TEST_CASE("duplicate entries resolve to the original account")
{
  TestAccount dup;
  dup.dup_of = 0;
  std::vector<std::uint8_t> buf =
      InputBuilder().account(counter_account(5)).account(dup).instruction({0x00, 1, 0, 0, 0}).build();

  TallyInput in;
  REQUIRE(tally_deserialize_input(buf.data(), buf.size(), &in) == 0);
  REQUIRE(in.account_count == 2);
  CHECK(in.accounts[1].data == in.accounts[0].data);
  CHECK(in.accounts[1].key == in.accounts[0].key);
  CHECK(in.accounts[1].dup_of == &in.accounts[0]);

  // Borrowing through the duplicate blocks the original
  const tally_u8 *r = nullptr;
  tally_u8 *w = nullptr;
  tally_u64 len = 0;
  REQUIRE(tally_account_borrow_data(&in.accounts[1], &r, &len) == 0);
  CHECK(tally_account_borrow_data_mut(&in.accounts[0], &w, &len) == TALLY_ERR(AccountBorrowFailed));
  REQUIRE(tally_account_release_data(&in.accounts[1]) == 0);
}

TEST_CASE("forward or self duplicate index is rejected")
{
  TestAccount self;
  self.dup_of = 0;
  std::vector<std::uint8_t> buf = InputBuilder().account(self).build();

  TallyInput in;
  CHECK(tally_deserialize_input(buf.data(), buf.size(), &in) == TALLY_ERR(MalformedInput));
}

TEST_CASE("truncated input is rejected at every cut point")
{
  std::vector<std::uint8_t> full =
      InputBuilder().account(counter_account(1)).instruction({0x00, 1, 0, 0, 0}).build();

  TallyInput in;
  REQUIRE(tally_deserialize_input(full.data(), full.size(), &in) == 0);

  // A sample of cut points across header, account, instruction and program id
  const std::size_t cuts[] = {0, 7, 8, 9, 50, 90, 96, 100, full.size() - 40,
                              full.size() - 33, full.size() - 1};
  for (std::size_t cut : cuts)
  {
    CHECK(tally_deserialize_input(full.data(), cut, &in) == TALLY_ERR(MalformedInput));
  }
}

TEST_CASE("more accounts than the decoder holds is rejected")
{
  InputBuilder b;
  for (int i = 0; i < TALLY_MAX_ACCOUNTS + 1; ++i)
    b.account(counter_account(0));
  std::vector<std::uint8_t> buf = b.build();

  TallyInput in;
  CHECK(tally_deserialize_input(buf.data(), buf.size(), &in) == TALLY_ERR(MalformedInput));
}

TEST_CASE("oversized data length does not overflow the bounds check")
{
  std::vector<std::uint8_t> buf = InputBuilder().account(counter_account(0)).build();
  // data_len sits after count(8) + flags(8) + key(32) + owner(32) + lamports(8)
  tally_st_le64(buf.data() + 88, UINT64_MAX - 4);

  TallyInput in;
  CHECK(tally_deserialize_input(buf.data(), buf.size(), &in) == TALLY_ERR(MalformedInput));
}

TEST_CASE("misaligned input buffer is rejected")
{
  std::vector<std::uint8_t> full =
      InputBuilder().account(counter_account(10)).instruction({0x00, 5, 0, 0, 0}).build();

  // Same bytes placed at an address that is not a multiple of 8
  std::vector<std::uint8_t> storage(full.size() + 8);
  std::uint8_t *p = storage.data();
  if ((reinterpret_cast<std::uintptr_t>(p) & 7u) == 0)
    ++p;
  std::memcpy(p, full.data(), full.size());

  TallyInput in;
  CHECK(tally_deserialize_input(p, full.size(), &in) == TALLY_ERR(MalformedInput));
  CHECK(in.account_count == 0);

  mock_host_reset();
  CHECK(tally_entrypoint(p, full.size()) == (2ull << 32));

  // The counter bytes were not touched
  TallyCounterState st{};
  REQUIRE(tally_state_decode(p + 96, 4, &st) == 0);
  CHECK(st.count == 10u);
}

/* ------------------------------------------------------------------------- */
/* End to end                                                                */
/* ------------------------------------------------------------------------- */
TEST_CASE("entrypoint applies the instruction in place")
{
  mock_host_reset();
  std::vector<std::uint8_t> buf =
      InputBuilder().account(counter_account(10)).instruction({0x00, 0x05, 0, 0, 0}).build();

  CHECK(tally_entrypoint(buf.data(), buf.size()) == 0);

  TallyInput in;
  REQUIRE(tally_deserialize_input(buf.data(), buf.size(), &in) == 0);
  CHECK(stored_count(in.accounts[0]) == 15u);
  REQUIRE(mock_host_log_count() == 1);
  CHECK(std::strcmp(mock_host_log_line(0), "Counter updated to 15") == 0);
}

TEST_CASE("entrypoint reports failures with host exit codes")
{
  const std::uint64_t kInvalidArgument = 2ull << 32;
  const std::uint64_t kInvalidInstructionData = 3ull << 32;
  const std::uint64_t kInvalidAccountData = 4ull << 32;
  const std::uint64_t kNotEnoughAccountKeys = 11ull << 32;

  SUBCASE("no accounts")
  {
    mock_host_reset();
    std::vector<std::uint8_t> buf = InputBuilder().instruction({0x00, 1, 0, 0, 0}).build();
    CHECK(tally_entrypoint(buf.data(), buf.size()) == kNotEnoughAccountKeys);
    REQUIRE(mock_host_log_count() == 1);
    CHECK(std::strcmp(mock_host_log_line(0),
                      "Program failed: not enough account keys (code=-1)") == 0);
  }

  SUBCASE("bad instruction")
  {
    mock_host_reset();
    std::vector<std::uint8_t> buf =
        InputBuilder().account(counter_account(3)).instruction({0x02, 1, 0, 0, 0}).build();
    CHECK(tally_entrypoint(buf.data(), buf.size()) == kInvalidInstructionData);

    TallyInput in;
    REQUIRE(tally_deserialize_input(buf.data(), buf.size(), &in) == 0);
    CHECK(stored_count(in.accounts[0]) == 3u);
  }

  SUBCASE("uninitialized account")
  {
    mock_host_reset();
    TestAccount empty;
    std::vector<std::uint8_t> buf =
        InputBuilder().account(empty).instruction({0x00, 1, 0, 0, 0}).build();
    CHECK(tally_entrypoint(buf.data(), buf.size()) == kInvalidAccountData);
  }

  SUBCASE("undecodable input")
  {
    mock_host_reset();
    std::uint8_t junk[4] = {1, 2, 3, 4};
    CHECK(tally_entrypoint(junk, sizeof(junk)) == kInvalidArgument);
    CHECK(mock_host_log_count() == 1);
  }
}
