#include "common/base58.h"
#include "common/crypto_utils.h"
#include "sdk/buffer_client.h"
#include "test_framework.h"
#include "region_fixture.h"
#include <algorithm>

using namespace chadbuffer::common;
using chadbuffer::sdk::BufferClient;
using chadbuffer::sdk::ComputeBudget;

namespace {

const PublicKey AUTHORITY = filled_key(0x0A);
const PublicKey BUFFER = filled_key(0x0B);

std::vector<uint8_t> counting(size_t length) {
  std::vector<uint8_t> data(length);
  for (size_t i = 0; i < length; ++i) {
    data[i] = static_cast<uint8_t>(i % 251);
  }
  return data;
}

BufferClient client_for(const std::vector<uint8_t> &data,
                        const ComputeBudget &budget = ComputeBudget()) {
  auto client = BufferClient::create(data, budget, BUFFER);
  if (client.is_err()) {
    throw std::runtime_error(client.error());
  }
  return std::move(client).value();
}

// Reassemble the blob from the client's shards
std::vector<uint8_t> reassemble(const BufferClient &client, size_t length) {
  std::vector<uint8_t> out(length, 0);
  const auto &shards = client.shards();
  std::copy(shards[0].begin(), shards[0].end(), out.begin());
  for (size_t i = 1; i < shards.size(); ++i) {
    size_t offset = shards[i][0] | (shards[i][1] << 8) | (shards[i][2] << 16);
    std::copy(shards[i].begin() + 3, shards[i].end(), out.begin() + offset);
  }
  return out;
}

} // namespace

void test_constants() {
  ASSERT_EQ(358u, BufferClient::INIT_DATA_SIZE);
  ASSERT_EQ(208u, BufferClient::WRITE_DATA_SIZE);
  ASSERT_EQ(1232u, BufferClient::TX_SIZE);
}

void test_small_blob_fits_in_init() {
  auto data = counting(100);
  auto client = client_for(data);

  ASSERT_EQ(1u, client.shards().size());
  ASSERT_BYTES_EQ(data, client.shards()[0]);
  ASSERT_EQ(132u, client.account_size());
  ASSERT_TRUE(client.pre_instructions().empty());
  ASSERT_EQ(0u, client.dynamic_ix_size());
  ASSERT_TRUE(client.create_write_transactions(AUTHORITY).empty());
}

void test_shard_sizes_without_budget() {
  auto data = counting(3000);
  auto client = client_for(data);
  const auto &shards = client.shards();

  // 874 bytes ride with Init, then 1024-byte writes
  ASSERT_EQ(4u, shards.size());
  ASSERT_EQ(874u, shards[0].size());
  ASSERT_EQ(3u + 1024u, shards[1].size());
  ASSERT_EQ(3u + 1024u, shards[2].size());
  ASSERT_EQ(3u + 78u, shards[3].size());
  ASSERT_BYTES_EQ(le_bytes(874, 3), byte_range(shards[1].data(), 3));
  ASSERT_BYTES_EQ(le_bytes(1898, 3), byte_range(shards[2].data(), 3));
  ASSERT_BYTES_EQ(le_bytes(2922, 3), byte_range(shards[3].data(), 3));
  ASSERT_BYTES_EQ(data, reassemble(client, data.size()));
}

void test_compute_budget_overhead() {
  ComputeBudget price_only;
  price_only.micro_lamports = 200000;
  auto priced = client_for(counting(2000), price_only);
  ASSERT_EQ(44u, priced.dynamic_ix_size());
  ASSERT_EQ(1u, priced.pre_instructions().size());
  ASSERT_EQ(830u, priced.shards()[0].size());

  ComputeBudget both;
  both.micro_lamports = 200000;
  both.units = 1000;
  auto client = client_for(counting(2000), both);
  ASSERT_EQ(52u, client.dynamic_ix_size());
  ASSERT_EQ(822u, client.shards()[0].size());
  ASSERT_EQ(3u + 972u, client.shards()[1].size());

  const auto &pre = client.pre_instructions();
  ASSERT_EQ(2u, pre.size());
  auto compute_budget = pubkey_from_base58("ComputeBudget111111111111111111111111111111");
  ASSERT_TRUE(compute_budget.is_ok());
  ASSERT_TRUE(pre[0].program_id == compute_budget.value());

  std::vector<uint8_t> price = {0x03};
  auto price_value = le_bytes(200000, 8);
  price.insert(price.end(), price_value.begin(), price_value.end());
  ASSERT_BYTES_EQ(price, pre[0].data);

  std::vector<uint8_t> limit = {0x02};
  auto limit_value = le_bytes(1000, 4);
  limit.insert(limit.end(), limit_value.begin(), limit_value.end());
  ASSERT_BYTES_EQ(limit, pre[1].data);
  ASSERT_TRUE(pre[1].accounts.empty());
}

void test_zero_budget_values_are_unset() {
  ComputeBudget zeros;
  zeros.micro_lamports = 0;
  zeros.units = 0;
  auto client = client_for(counting(10), zeros);
  ASSERT_EQ(0u, client.dynamic_ix_size());
  ASSERT_TRUE(client.pre_instructions().empty());
}

void test_checksum_and_verify() {
  auto data = counting(700);
  auto client = client_for(data);
  auto expected = CryptoUtils::sha256(data);
  ASSERT_TRUE(expected.is_ok());
  ASSERT_BYTES_EQ(expected.value(), client.checksum());

  std::vector<uint8_t> account_data = filled_key(0x44);
  account_data.insert(account_data.end(), data.begin(), data.end());
  ASSERT_TRUE(client.verify(account_data).value());

  account_data.back() ^= 0x01;
  ASSERT_FALSE(client.verify(account_data).value());

  ASSERT_TRUE(client.verify(std::vector<uint8_t>(31, 0)).is_err());
}

void test_instruction_encoding() {
  auto data = counting(2000);
  auto client = client_for(data);

  auto init = client.create_initialize_instruction(AUTHORITY);
  ASSERT_EQ(std::string("bufzJtwkkoXEVh4eKFsshPFacLpgpxarasuDSvzGvxd"),
            encode_base58(init.program_id));
  ASSERT_EQ(0, init.data[0]);
  ASSERT_EQ(1u + client.shards()[0].size(), init.data.size());
  ASSERT_EQ(2u, init.accounts.size());
  ASSERT_TRUE(init.accounts[0].pubkey == AUTHORITY);
  ASSERT_TRUE(init.accounts[0].is_signer && init.accounts[0].is_writable);
  ASSERT_TRUE(init.accounts[1].pubkey == BUFFER);
  ASSERT_TRUE(init.accounts[1].is_signer && init.accounts[1].is_writable);

  auto assign = client.create_assign_instruction(AUTHORITY, filled_key(0x0C));
  ASSERT_EQ(33u, assign.data.size());
  ASSERT_EQ(1, assign.data[0]);
  ASSERT_FALSE(assign.accounts[1].is_signer);
  ASSERT_TRUE(assign.accounts[1].is_writable);

  auto writes = client.create_write_transactions(AUTHORITY);
  ASSERT_EQ(client.shards().size() - 1, writes.size());
  const auto &write = writes[0].back();
  ASSERT_EQ(2, write.data[0]);
  ASSERT_BYTES_EQ(client.shards()[1], std::vector<uint8_t>(write.data.begin() + 1, write.data.end()));
  ASSERT_FALSE(write.accounts[1].is_signer);

  auto close = client.create_close_instruction(AUTHORITY);
  ASSERT_BYTES_EQ(std::vector<uint8_t>({3}), close.data);
  ASSERT_TRUE(close.accounts[0].is_signer);
}

void test_create_account_instruction() {
  auto client = client_for(counting(64));
  auto ix = client.create_account_instruction(AUTHORITY, 123456);

  ASSERT_TRUE(ix.program_id == PublicKey(32, 0));
  ASSERT_EQ(52u, ix.data.size());
  ASSERT_BYTES_EQ(le_bytes(0, 4), byte_range(ix.data.data(), 4));
  ASSERT_BYTES_EQ(le_bytes(123456, 8), byte_range(ix.data.data() + 4, 8));
  ASSERT_BYTES_EQ(le_bytes(96, 8), byte_range(ix.data.data() + 12, 8));
  ASSERT_BYTES_EQ(client.program_id(), byte_range(ix.data.data() + 20, 32));
  ASSERT_TRUE(ix.accounts[1].is_signer);
}

void test_transactions_carry_pre_instructions() {
  ComputeBudget budget;
  budget.units = 5000;
  auto client = client_for(counting(3000), budget);

  auto init = client.create_initialize_transaction(AUTHORITY, 1);
  ASSERT_EQ(3u, init.size());
  ASSERT_TRUE(init[0].data[0] == 0x02);
  ASSERT_TRUE(init[1].program_id == PublicKey(32, 0));
  ASSERT_EQ(0, init[2].data[0]);

  for (const auto &transaction : client.create_write_transactions(AUTHORITY)) {
    ASSERT_EQ(2u, transaction.size());
  }
  ASSERT_EQ(2u, client.create_close_transaction(AUTHORITY).size());
  ASSERT_EQ(2u, client.create_assign_transaction(AUTHORITY, BUFFER).size());
}

void test_invalid_arguments() {
  ASSERT_TRUE(BufferClient::create(counting(4), ComputeBudget(), filled_key(1)).is_ok());
  ASSERT_TRUE(BufferClient::create(counting(4), ComputeBudget(), PublicKey(31, 1)).is_err());
  ASSERT_TRUE(BufferClient::create(counting(4), ComputeBudget(), BUFFER, PublicKey(5, 1)).is_err());
  ASSERT_TRUE(BufferClient::create(std::vector<uint8_t>(BufferClient::MAX_DATA_SIZE + 1),
                                   ComputeBudget(), BUFFER)
                  .is_err());
}

void test_empty_blob() {
  auto client = client_for({});
  ASSERT_EQ(1u, client.shards().size());
  ASSERT_TRUE(client.shards()[0].empty());
  ASSERT_EQ(32u, client.account_size());
  ASSERT_TRUE(client.verify(filled_key(0x01)).value());
}

int main() {
  std::cout << "=== Buffer Client Test Suite ===" << std::endl;
  TestRunner runner;
  runner.run_test("Constants", test_constants);
  runner.run_test("Small Blob Fits In Init", test_small_blob_fits_in_init);
  runner.run_test("Shard Sizes Without Budget", test_shard_sizes_without_budget);
  runner.run_test("Compute Budget Overhead", test_compute_budget_overhead);
  runner.run_test("Zero Budget Values", test_zero_budget_values_are_unset);
  runner.run_test("Checksum And Verify", test_checksum_and_verify);
  runner.run_test("Instruction Encoding", test_instruction_encoding);
  runner.run_test("Create Account Instruction", test_create_account_instruction);
  runner.run_test("Transactions Carry Pre Instructions", test_transactions_carry_pre_instructions);
  runner.run_test("Invalid Arguments", test_invalid_arguments);
  runner.run_test("Empty Blob", test_empty_blob);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
