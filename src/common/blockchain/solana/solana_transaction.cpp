#include "blockchain/solana/solana_transaction.h"
#include "blockchain/solana/base58.h"
#include "wire_utils.h"
#include "cosigner/cosigner_exception.h"
#include "logging/logging_t.h"

#include <stdint.h>
#include <string.h>

#include <map>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

using common::cosigner::cosigner_exception;

static const ed25519_point_t MEMO_PROGRAM_RAW = {
    0x05, 0x4a, 0x53, 0x5a, 0x99, 0x29, 0x21, 0x06, 0x4d, 0x24, 0xe8, 0x71, 0x60, 0xda, 0x38, 0x7c,
    0x7c, 0x35, 0xb5, 0xdd, 0xbc, 0x92, 0xbb, 0x81, 0xe4, 0x1f, 0xa8, 0x40, 0x41, 0x05, 0x44, 0x8d};

const elliptic_curve_point SYSTEM_PROGRAM_ID;
const elliptic_curve_point MEMO_PROGRAM_ID(MEMO_PROGRAM_RAW);

// accounts are addressed by a one byte index
static constexpr size_t MAX_ACCOUNTS = 256;

namespace
{

struct account_flags
{
    bool is_signer;
    bool is_writable;
};

class wire_reader
{
public:
    explicit wire_reader(const byte_vector_t& data) : _data(data), _offset(0) {}

    uint8_t read_u8()
    {
        if (_offset >= _data.size())
            truncated();
        return _data[_offset++];
    }

    // 1 to 3 bytes, 7 bits per byte, redundant encodings are rejected
    uint16_t read_compact_u16()
    {
        uint32_t value = 0;
        for (size_t i = 0; i < 3; ++i)
        {
            uint8_t b = read_u8();
            if (i > 0 && b == 0)
            {
                LOG_ERROR("non canonical compact-u16 encoding at offset %lu", _offset - 1);
                throw cosigner_exception(cosigner_exception::INVALID_TRANSACTION);
            }
            if (i == 2 && b > 0x03)
            {
                LOG_ERROR("compact-u16 overflow at offset %lu", _offset - 1);
                throw cosigner_exception(cosigner_exception::INVALID_TRANSACTION);
            }
            value |= (uint32_t)(b & 0x7f) << (7 * i);
            if (!(b & 0x80))
                return (uint16_t)value;
        }
        LOG_ERROR("compact-u16 is longer than 3 bytes at offset %lu", _offset);
        throw cosigner_exception(cosigner_exception::INVALID_TRANSACTION);
    }

    void read(uint8_t* out, size_t len)
    {
        if (_data.size() - _offset < len)
            truncated();
        memcpy(out, _data.data() + _offset, len);
        _offset += len;
    }

    byte_vector_t read_vector(size_t len)
    {
        if (_data.size() - _offset < len)
            truncated();
        byte_vector_t ret(_data.begin() + _offset, _data.begin() + _offset + len);
        _offset += len;
        return ret;
    }

    bool eof() const {return _offset == _data.size();}
    size_t offset() const {return _offset;}

private:
    [[noreturn]] void truncated() const
    {
        LOG_ERROR("transaction is truncated at offset %lu", _offset);
        throw cosigner_exception(cosigner_exception::INVALID_TRANSACTION);
    }

    const byte_vector_t& _data;
    size_t _offset;
};

void write_compact_u16(byte_vector_t& out, size_t value)
{
    if (value > UINT16_MAX)
    {
        LOG_ERROR("length %lu doesn't fit compact-u16", value);
        throw cosigner_exception(cosigner_exception::INVALID_TRANSACTION);
    }
    do
    {
        uint8_t b = value & 0x7f;
        value >>= 7;
        if (value)
            b |= 0x80;
        out.push_back(b);
    } while (value);
}

solana_message read_message(wire_reader& reader)
{
    solana_message msg;
    msg.header.num_required_signatures = reader.read_u8();
    msg.header.num_readonly_signed_accounts = reader.read_u8();
    msg.header.num_readonly_unsigned_accounts = reader.read_u8();

    uint16_t num_keys = reader.read_compact_u16();
    msg.account_keys.resize(num_keys);
    for (auto i = msg.account_keys.begin(); i != msg.account_keys.end(); ++i)
        reader.read(i->data, sizeof(ed25519_point_t));
    reader.read(msg.recent_blockhash.data(), msg.recent_blockhash.size());

    if (!msg.header.num_required_signatures || msg.header.num_required_signatures > num_keys ||
        msg.header.num_readonly_signed_accounts >= msg.header.num_required_signatures ||
        msg.header.num_readonly_unsigned_accounts > num_keys - msg.header.num_required_signatures)
    {
        LOG_ERROR("invalid message header %u %u %u for %u accounts", msg.header.num_required_signatures, msg.header.num_readonly_signed_accounts,
            msg.header.num_readonly_unsigned_accounts, num_keys);
        throw cosigner_exception(cosigner_exception::INVALID_TRANSACTION);
    }

    uint16_t num_instructions = reader.read_compact_u16();
    msg.instructions.resize(num_instructions);
    for (auto i = msg.instructions.begin(); i != msg.instructions.end(); ++i)
    {
        i->program_id_index = reader.read_u8();
        if (i->program_id_index >= num_keys)
        {
            LOG_ERROR("program id index %u out of range", i->program_id_index);
            throw cosigner_exception(cosigner_exception::INVALID_TRANSACTION);
        }
        i->accounts = reader.read_vector(reader.read_compact_u16());
        for (auto j = i->accounts.begin(); j != i->accounts.end(); ++j)
        {
            if (*j >= num_keys)
            {
                LOG_ERROR("account index %u out of range", *j);
                throw cosigner_exception(cosigner_exception::INVALID_TRANSACTION);
            }
        }
        i->data = reader.read_vector(reader.read_compact_u16());
    }
    return msg;
}

void check_eof(const wire_reader& reader)
{
    if (!reader.eof())
    {
        LOG_ERROR("got trailing bytes after offset %lu", reader.offset());
        throw cosigner_exception(cosigner_exception::INVALID_TRANSACTION);
    }
}

}

solana_message solana_message::compile(const std::vector<instruction>& instructions, const elliptic_curve_point& payer, const solana_hash_t& recent_blockhash)
{
    std::map<elliptic_curve_point, account_flags> accounts;
    accounts[payer] = account_flags{true, true};
    for (auto i = instructions.begin(); i != instructions.end(); ++i)
    {
        for (auto meta = i->accounts.begin(); meta != i->accounts.end(); ++meta)
        {
            auto it = accounts.find(meta->pubkey);
            if (it == accounts.end())
                accounts[meta->pubkey] = account_flags{meta->is_signer, meta->is_writable};
            else
            {
                it->second.is_signer |= meta->is_signer;
                it->second.is_writable |= meta->is_writable;
            }
        }
        if (accounts.find(i->program_id) == accounts.end())
            accounts[i->program_id] = account_flags{false, false};
    }

    if (accounts.size() > MAX_ACCOUNTS)
    {
        LOG_ERROR("transaction references %lu accounts", accounts.size());
        throw cosigner_exception(cosigner_exception::INVALID_TRANSACTION);
    }

    solana_message msg;
    msg.header = message_header{0, 0, 0};
    msg.account_keys.push_back(payer);
    msg.header.num_required_signatures = 1;

    // writable signers, readonly signers, writable non signers, readonly non signers
    for (int group = 0; group < 4; ++group)
    {
        const bool signer = group < 2;
        const bool writable = group % 2 == 0;
        for (auto i = accounts.begin(); i != accounts.end(); ++i)
        {
            if (i->first == payer || i->second.is_signer != signer || i->second.is_writable != writable)
                continue;
            msg.account_keys.push_back(i->first);
            if (signer)
                msg.header.num_required_signatures++;
            if (signer && !writable)
                msg.header.num_readonly_signed_accounts++;
            if (!signer && !writable)
                msg.header.num_readonly_unsigned_accounts++;
        }
    }

    std::map<elliptic_curve_point, uint8_t> indexes;
    for (size_t i = 0; i < msg.account_keys.size(); ++i)
        indexes[msg.account_keys[i]] = (uint8_t)i;

    for (auto i = instructions.begin(); i != instructions.end(); ++i)
    {
        compiled_instruction compiled;
        compiled.program_id_index = indexes[i->program_id];
        for (auto meta = i->accounts.begin(); meta != i->accounts.end(); ++meta)
            compiled.accounts.push_back(indexes[meta->pubkey]);
        compiled.data = i->data;
        msg.instructions.push_back(compiled);
    }
    msg.recent_blockhash = recent_blockhash;
    return msg;
}

solana_message solana_message::parse(const byte_vector_t& data)
{
    wire_reader reader(data);
    solana_message msg = read_message(reader);
    check_eof(reader);
    return msg;
}

byte_vector_t solana_message::serialize() const
{
    byte_vector_t out;
    out.push_back(header.num_required_signatures);
    out.push_back(header.num_readonly_signed_accounts);
    out.push_back(header.num_readonly_unsigned_accounts);

    write_compact_u16(out, account_keys.size());
    for (auto i = account_keys.begin(); i != account_keys.end(); ++i)
        out.insert(out.end(), i->data, i->data + sizeof(ed25519_point_t));
    out.insert(out.end(), recent_blockhash.begin(), recent_blockhash.end());

    write_compact_u16(out, instructions.size());
    for (auto i = instructions.begin(); i != instructions.end(); ++i)
    {
        out.push_back(i->program_id_index);
        write_compact_u16(out, i->accounts.size());
        out.insert(out.end(), i->accounts.begin(), i->accounts.end());
        write_compact_u16(out, i->data.size());
        out.insert(out.end(), i->data.begin(), i->data.end());
    }
    return out;
}

solana_transaction solana_transaction::new_unsigned(const solana_message& message)
{
    solana_transaction tx;
    tx.message = message;
    solana_signature_t empty;
    empty.fill(0);
    tx.signatures.assign(message.header.num_required_signatures, empty);
    return tx;
}

solana_transaction solana_transaction::parse(const byte_vector_t& data)
{
    wire_reader reader(data);
    solana_transaction tx;
    tx.signatures.resize(reader.read_compact_u16());
    for (auto i = tx.signatures.begin(); i != tx.signatures.end(); ++i)
        reader.read(i->data(), i->size());

    tx.message = read_message(reader);
    check_eof(reader);

    if (tx.signatures.size() != tx.message.header.num_required_signatures)
    {
        LOG_ERROR("transaction has %lu signatures, its message requires %u", tx.signatures.size(), tx.message.header.num_required_signatures);
        throw cosigner_exception(cosigner_exception::INVALID_TRANSACTION);
    }
    return tx;
}

byte_vector_t solana_transaction::serialize() const
{
    byte_vector_t out;
    write_compact_u16(out, signatures.size());
    for (auto i = signatures.begin(); i != signatures.end(); ++i)
        out.insert(out.end(), i->begin(), i->end());
    byte_vector_t msg = message.serialize();
    out.insert(out.end(), msg.begin(), msg.end());
    return out;
}

std::string solana_transaction::id() const
{
    if (signatures.empty())
        throw cosigner_exception(cosigner_exception::INVALID_TRANSACTION);
    return base58_encode(signatures[0].data(), signatures[0].size());
}

instruction transfer_instruction(const elliptic_curve_point& from, const elliptic_curve_point& to, uint64_t lamports)
{
    instruction ins;
    ins.program_id = SYSTEM_PROGRAM_ID;
    ins.accounts.push_back(account_meta{from, true, true});
    ins.accounts.push_back(account_meta{to, false, true});

    append_le<uint32_t>(ins.data, SYSTEM_INSTRUCTION_TRANSFER);
    append_le<uint64_t>(ins.data, lamports);
    return ins;
}

instruction memo_instruction(const std::string& memo)
{
    instruction ins;
    ins.program_id = MEMO_PROGRAM_ID;
    ins.data.assign(memo.begin(), memo.end());
    return ins;
}

uint64_t sol_to_lamports(double sol)
{
    if (!(sol > 0))
        return 0;
    double lamports = sol * (double)LAMPORTS_PER_SOL;
    if (lamports >= 18446744073709551615.0)
        return UINT64_MAX;
    return (uint64_t)lamports;
}

solana_transaction create_unsigned_transfer(double amount, const elliptic_curve_point& to, const std::optional<std::string>& memo, const elliptic_curve_point& payer, const solana_hash_t& recent_blockhash)
{
    std::vector<instruction> instructions;
    instructions.push_back(transfer_instruction(payer, to, sol_to_lamports(amount)));
    if (memo)
        instructions.push_back(memo_instruction(*memo));
    return solana_transaction::new_unsigned(solana_message::compile(instructions, payer, recent_blockhash));
}

}
}
}
