#include "program/decoder.h"
#include "program/input_region.h"
#include "program/layout.h"
#include "test_framework.h"
#include "region_fixture.h"

using namespace chadbuffer::program;
using chadbuffer::runtime::AlignedRegion;

void test_fixed_offsets() {
  ASSERT_EQ(0x0008u, InputLayout::SIGNER_HEADER);
  ASSERT_EQ(0x0010u, InputLayout::SIGNER_KEY);
  ASSERT_EQ(0x0050u, InputLayout::SIGNER_LAMPORTS);
  ASSERT_EQ(0x2890u, InputLayout::BUFFER_OWNER);
  ASSERT_EQ(0x28b0u, InputLayout::BUFFER_LAMPORTS);
  ASSERT_EQ(0x28b8u, InputLayout::BUFFER_SIZE);
  ASSERT_EQ(0x28c0u, InputLayout::BUFFER_AUTH);
  ASSERT_EQ(0x28e0u, InputLayout::BUFFER_DATA);
  ASSERT_EQ(0x50c8u, InputLayout::IX_MIN_OFFSET);
}

void test_account_flags_decode() {
  auto flags = AccountFlags::decode(0x0101ff);
  ASSERT_EQ(0xff, flags.dup_marker);
  ASSERT_EQ(1, flags.is_signer);
  ASSERT_EQ(1, flags.is_writable);
  ASSERT_EQ(0, flags.executable);
  ASSERT_FALSE(flags.is_duplicate());
  ASSERT_TRUE(flags.is_fresh_writable_signer());
  ASSERT_EQ(AccountFlags::SIGNER_WRITABLE_NODUP, flags.encode());
}

void test_account_flags_symbolic_matches_bit_pattern() {
  // Every header whose low three bytes differ from the signer pattern, or
  // that marks the account executable, is rejected
  const uint32_t samples[] = {0x000000, 0x0001ff, 0x0100ff, 0x010100, 0x010101,
                              0x0101fe, 0x0201ff, 0x0102ff, 0x0101ff,
                              0x010101ff, 0xffffffff};
  for (uint32_t raw : samples) {
    bool expected = raw == AccountFlags::SIGNER_WRITABLE_NODUP;
    ASSERT_EQ(expected, AccountFlags::decode(raw).is_fresh_writable_signer());
  }
}

void test_account_flags_describe() {
  ASSERT_EQ(std::string("nodup signer writable"), AccountFlags::decode(0x0101ff).describe());
  ASSERT_EQ(std::string("dup(0) writable"), AccountFlags::decode(0x010000).describe());
}

void test_instruction_block_alignment() {
  AlignedRegion storage(16);
  const uint8_t *base = storage.data();
  ASSERT_EQ(0x50c8u, instruction_block_offset(base, 0));
  ASSERT_EQ(0x50d0u, instruction_block_offset(base, 1));
  ASSERT_EQ(0x50d0u, instruction_block_offset(base, 7));
  ASSERT_EQ(0x50d0u, instruction_block_offset(base, 8));
  ASSERT_EQ(0x50e8u, instruction_block_offset(base, 32));
  ASSERT_EQ(0x50f0u, instruction_block_offset(base, 35));
}

void test_serializer_matches_offset_table() {
  auto signer = make_signer(filled_key(0x11), 777);
  auto buffer = make_buffer(filled_key(0x22), filled_key(0x33), {1, 2, 3, 4, 5}, 999);
  std::vector<uint8_t> ix = {0x03};
  auto region = build_region({signer, buffer}, ix);

  ASSERT_EQ(2u, region_u64(*region, InputLayout::ACCOUNT_COUNT));
  ASSERT_EQ(AccountFlags::SIGNER_WRITABLE_NODUP,
            static_cast<uint32_t>(region_u64(*region, InputLayout::SIGNER_HEADER) & 0xffffffff));
  ASSERT_BYTES_EQ(filled_key(0x11), region_bytes(*region, InputLayout::SIGNER_KEY, 32));
  ASSERT_EQ(777u, region_u64(*region, InputLayout::SIGNER_LAMPORTS));
  ASSERT_EQ(0u, region_u64(*region, InputLayout::SIGNER_DATA_LEN));
  ASSERT_BYTES_EQ(filled_key(0x22), region_bytes(*region, InputLayout::BUFFER_KEY, 32));
  ASSERT_BYTES_EQ(filled_key(0xb0), region_bytes(*region, InputLayout::BUFFER_OWNER, 32));
  ASSERT_EQ(999u, region_u64(*region, InputLayout::BUFFER_LAMPORTS));
  ASSERT_EQ(37u, region_u64(*region, InputLayout::BUFFER_SIZE));
  ASSERT_BYTES_EQ(filled_key(0x33), region_bytes(*region, InputLayout::BUFFER_AUTH, 32));
  ASSERT_BYTES_EQ(std::vector<uint8_t>({1, 2, 3, 4, 5}),
                  region_bytes(*region, InputLayout::BUFFER_DATA, 5));

  size_t ix_offset = instruction_block_offset(region->data(), 37);
  ASSERT_EQ(1u, region_u64(*region, ix_offset));
  ASSERT_EQ(0x03, region->data()[ix_offset + 8]);
  ASSERT_BYTES_EQ(filled_key(0xb0), region_bytes(*region, ix_offset + 9, 32));
  ASSERT_EQ(ix_offset + 9 + 32, region->size());
}

void test_decoder_reads_instruction_frame() {
  auto signer = make_signer(filled_key(0x11));
  auto buffer = make_buffer(filled_key(0x22), filled_key(0x11), {9, 9, 9});
  std::vector<uint8_t> ix = {0x02, 0x01, 0x00, 0x00, 0xaa};
  auto region = build_region({signer, buffer}, ix);

  auto borrowed = InputRegion::borrow(region->data(), region->size());
  ASSERT_TRUE(borrowed.is_ok());

  auto header = LayoutDecoder<InputRegion>::decode_accounts(borrowed.value());
  ASSERT_EQ(2u, header.account_count);
  ASSERT_TRUE(header.signer_flags.is_fresh_writable_signer());

  auto frame = LayoutDecoder<InputRegion>::decode_instruction(borrowed.value());
  ASSERT_FALSE(is_error(frame));
  const auto &decoded = std::get<InstructionFrame>(frame);
  ASSERT_EQ(5u, decoded.instruction_length);
  ASSERT_EQ(2, decoded.discriminator);
  ASSERT_EQ(4u, decoded.payload_length());
  ASSERT_EQ(decoded.length_offset + 9, decoded.payload_offset);
}

void test_region_borrow_validation() {
  AlignedRegion storage(InputLayout::MIN_REGION_SIZE + 8);

  ASSERT_TRUE(InputRegion::borrow(nullptr, 100000).is_err());
  ASSERT_TRUE(InputRegion::borrow(storage.data() + 1, InputLayout::MIN_REGION_SIZE).is_err());
  ASSERT_TRUE(InputRegion::borrow(storage.data(), InputLayout::MIN_REGION_SIZE - 1).is_err());

  auto region = InputRegion::borrow(storage.data(), storage.size());
  ASSERT_TRUE(region.is_ok());
  ASSERT_TRUE(region.value().contains(0, storage.size()));
  ASSERT_FALSE(region.value().contains(1, storage.size()));
  ASSERT_FALSE(region.value().contains(storage.size() + 1, 0));
  ASSERT_FALSE(region.value().contains(8, SIZE_MAX));
}

void test_read_u24_masks_top_byte() {
  AlignedRegion storage(InputLayout::MIN_REGION_SIZE);
  storage.data()[100] = 0x01;
  storage.data()[101] = 0x02;
  storage.data()[102] = 0x03;
  storage.data()[103] = 0xff;
  auto region = InputRegion::borrow(storage.data(), storage.size());
  ASSERT_TRUE(region.is_ok());
  ASSERT_EQ(0x030201u, region.value().read_u24(100));
  ASSERT_EQ(0x030201u, TrustedInput(storage.data()).read_u24(100));
}

void test_volatile_zero_write() {
  std::vector<uint8_t> bytes(40, 0xee);
  write_zeroes_volatile(bytes.data() + 4, 32);
  ASSERT_EQ(0xee, bytes[3]);
  ASSERT_BYTES_EQ(std::vector<uint8_t>(32, 0), byte_range(bytes.data() + 4, 32));
  ASSERT_EQ(0xee, bytes[36]);
}

int main() {
  std::cout << "=== Input Layout Test Suite ===" << std::endl;
  TestRunner runner;
  runner.run_test("Fixed Offsets", test_fixed_offsets);
  runner.run_test("Account Flags Decode", test_account_flags_decode);
  runner.run_test("Account Flags Match Bit Pattern",
                  test_account_flags_symbolic_matches_bit_pattern);
  runner.run_test("Account Flags Describe", test_account_flags_describe);
  runner.run_test("Instruction Block Alignment", test_instruction_block_alignment);
  runner.run_test("Serializer Matches Offset Table", test_serializer_matches_offset_table);
  runner.run_test("Decoder Reads Instruction Frame", test_decoder_reads_instruction_frame);
  runner.run_test("Region Borrow Validation", test_region_borrow_validation);
  runner.run_test("Read U24", test_read_u24_masks_top_byte);
  runner.run_test("Volatile Zero Write", test_volatile_zero_write);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
