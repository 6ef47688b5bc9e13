#include "blockchain/solana/tss_wallet_service.h"
#include "blockchain/solana/base58.h"
#include "blockchain/solana/spl_token.h"
#include "blockchain/solana/stake.h"
#include "blockchain/solana/transaction_assembler.h"
#include "cosigner/aggregated_eddsa_signing_service.h"
#include "cosigner/cosigner_exception.h"
#include "cosigner/platform_service.h"
#include "logging/logging_t.h"

#include <inttypes.h>

namespace solana_tss
{
namespace blockchain
{
namespace solana
{

using common::cosigner::aggregated_signature_result;
using common::cosigner::commitment;
using common::cosigner::cosigner_exception;
using common::cosigner::elliptic_curve_scalar;
using common::cosigner::partial_signature_result;
using common::cosigner::signing_start_result;

const std::unique_ptr<ed25519_algebra_ctx_t, void(*)(ed25519_algebra_ctx_t*)> tss_wallet_service::_ed25519(ed25519_algebra_ctx_new(), ed25519_algebra_ctx_free);

static std::vector<elliptic_curve_point> parse_pubkeys(const std::vector<std::string>& keys)
{
    std::vector<elliptic_curve_point> ret;
    ret.reserve(keys.size());
    for (auto i = keys.begin(); i != keys.end(); ++i)
        ret.push_back(parse_pubkey(*i));
    return ret;
}

tss_wallet_service::tss_wallet_service(const common::cosigner::platform_service& service, common::cosigner::aggregated_eddsa_signing_service& signing_service, rpc_service& rpc) :
    _service(service),
    _signing_service(signing_service),
    _rpc(rpc)
{
    if (!_ed25519)
    {
        LOG_ERROR("Failed to create ed25519 algebra");
        throw cosigner_exception(cosigner_exception::NO_MEM);
    }
}

generated_keypair tss_wallet_service::generate_keypair()
{
    ed25519_keypair keypair = solana::generate_keypair(_service);
    generated_keypair ret;
    ret.secret_share = serialize_keypair(keypair);
    ret.public_share = to_string(keypair.public_key);
    return ret;
}

uint64_t tss_wallet_service::balance(const std::string& address, solana_network network)
{
    return _rpc.get_balance(parse_pubkey(address), network);
}

std::string tss_wallet_service::airdrop(const std::string& to, double amount, solana_network network)
{
    elliptic_curve_point address = parse_pubkey(to);
    uint64_t lamports = sol_to_lamports(amount);
    std::string signature = _rpc.request_airdrop(address, lamports, network);
    _rpc.confirm_transaction(signature, _rpc.get_latest_blockhash(network), network);
    LOG_INFO("airdropped %" PRIu64 " lamports to %s on %s", lamports, to.c_str(), to_string(network));
    return signature;
}

std::string tss_wallet_service::recent_block_hash(solana_network network)
{
    return to_string(_rpc.get_latest_blockhash(network));
}

std::string tss_wallet_service::send_single(const std::string& keypair, double amount, const std::string& to, const std::optional<std::string>& memo, solana_network network)
{
    ed25519_keypair signer = parse_keypair(keypair);
    elliptic_curve_point destination = parse_pubkey(to);
    solana_hash_t recent_hash = _rpc.get_latest_blockhash(network);

    return sign_and_send(signer, create_unsigned_transfer(amount, destination, memo, signer.public_key, recent_hash), network);
}

std::string tss_wallet_service::sign_and_send(const ed25519_keypair& signer, solana_transaction tx, solana_network network)
{
    byte_vector_t message = tx.message.serialize();

    uint8_t raw_sig[ED25519_SIGNATURE_LEN];
    common::cosigner::throw_cosigner_exception(ed25519_algebra_sign(_ed25519.get(), raw_sig, &signer.seed, message.data(), message.size()));
    eddsa_signature signature;
    memcpy(signature.R, raw_sig, sizeof(ed25519_point_t));
    memcpy(signature.s, raw_sig + sizeof(ed25519_point_t), sizeof(ed25519_le_scalar_t));

    byte_vector_t serialized = transaction_assembler::attach_signature(tx, signer.public_key, signature, message);
    std::string tx_id = transaction_assembler::broadcast(_rpc, network, serialized);
    _rpc.confirm_transaction(tx_id, tx.message.recent_blockhash, network);
    return tx_id;
}

token_balance tss_wallet_service::spl_token_balance(const std::string& owner, const std::string& token_mint, solana_network network)
{
    elliptic_curve_point wallet = parse_pubkey(owner);
    elliptic_curve_point mint = parse_pubkey(token_mint);
    elliptic_curve_point address = associated_token_address(wallet, mint);

    std::optional<byte_vector_t> data = _rpc.get_account_data(address, network);
    if (!data)
    {
        LOG_ERROR("token account %s of %s doesn't exist on %s", to_string(address).c_str(), owner.c_str(), to_string(network));
        throw cosigner_exception(cosigner_exception::ACCOUNT_NOT_FOUND);
    }
    token_account account = parse_token_account(*data);
    if (account.mint != mint || account.owner != wallet)
    {
        LOG_ERROR("token account %s doesn't belong to %s for mint %s", to_string(address).c_str(), owner.c_str(), token_mint.c_str());
        throw cosigner_exception(cosigner_exception::INVALID_ACCOUNT_DATA);
    }

    std::optional<byte_vector_t> mint_data = _rpc.get_account_data(mint, network);
    if (!mint_data)
    {
        LOG_ERROR("mint %s doesn't exist on %s", token_mint.c_str(), to_string(network));
        throw cosigner_exception(cosigner_exception::ACCOUNT_NOT_FOUND);
    }

    token_balance ret;
    ret.address = to_string(address);
    ret.token_mint = token_mint;
    ret.amount = account.amount;
    ret.decimals = parse_mint_decimals(*mint_data);
    return ret;
}

std::string tss_wallet_service::spl_send_single(const std::string& keypair, double amount, const std::string& to, const std::string& token_mint, const std::optional<std::string>& memo, solana_network network)
{
    ed25519_keypair signer = parse_keypair(keypair);
    elliptic_curve_point destination = parse_pubkey(to);
    elliptic_curve_point mint = parse_pubkey(token_mint);

    std::optional<byte_vector_t> mint_data = _rpc.get_account_data(mint, network);
    if (!mint_data)
    {
        LOG_ERROR("mint %s doesn't exist on %s", token_mint.c_str(), to_string(network));
        throw cosigner_exception(cosigner_exception::ACCOUNT_NOT_FOUND);
    }
    uint8_t decimals = parse_mint_decimals(*mint_data);
    bool create_destination = !_rpc.get_account_data(associated_token_address(destination, mint), network);
    solana_hash_t recent_hash = _rpc.get_latest_blockhash(network);

    solana_transaction tx = create_unsigned_spl_transfer(amount, decimals, destination, mint, memo, create_destination, signer.public_key, recent_hash);
    LOG_INFO("sending %" PRIu64 " of token %s to %s%s", to_token_amount(amount, decimals), token_mint.c_str(), to.c_str(), create_destination ? ", creating its token account" : "");
    return sign_and_send(signer, tx, network);
}

std::string tss_wallet_service::stake_account_address(const std::string& authority, const std::string& seed)
{
    return to_string(solana::stake_account_address(parse_pubkey(authority), seed));
}

stake_result tss_wallet_service::stake(const std::string& keypair, double amount, const std::string& seed, const std::string& vote_account, solana_network network)
{
    ed25519_keypair signer = parse_keypair(keypair);
    elliptic_curve_point vote = parse_pubkey(vote_account);
    uint64_t rent = stake_rent_exemption(network);
    solana_hash_t recent_hash = _rpc.get_latest_blockhash(network);

    solana_transaction tx = create_unsigned_stake_account(sol_to_lamports(amount), rent, seed, signer.public_key, vote, recent_hash);
    stake_result ret;
    ret.stake_account = to_string(solana::stake_account_address(signer.public_key, seed));
    ret.transaction_id = sign_and_send(signer, tx, network);
    LOG_INFO("delegated stake account %s to %s on %s", ret.stake_account.c_str(), vote_account.c_str(), to_string(network));
    return ret;
}

std::string tss_wallet_service::deactivate_stake(const std::string& keypair, const std::string& stake_account, solana_network network)
{
    ed25519_keypair signer = parse_keypair(keypair);
    elliptic_curve_point account = parse_pubkey(stake_account);
    solana_hash_t recent_hash = _rpc.get_latest_blockhash(network);

    return sign_and_send(signer, create_unsigned_deactivate_stake(account, signer.public_key, recent_hash), network);
}

std::string tss_wallet_service::withdraw_stake(const std::string& keypair, const std::string& stake_account, const std::string& to, double amount, solana_network network)
{
    ed25519_keypair signer = parse_keypair(keypair);
    elliptic_curve_point account = parse_pubkey(stake_account);
    elliptic_curve_point destination = parse_pubkey(to);
    solana_hash_t recent_hash = _rpc.get_latest_blockhash(network);

    return sign_and_send(signer, create_unsigned_withdraw_stake(account, destination, signer.public_key, sol_to_lamports(amount), recent_hash), network);
}

uint64_t tss_wallet_service::stake_rent_exemption(solana_network network)
{
    return _rpc.get_minimum_balance_for_rent_exemption(STAKE_STATE_SIZE, network);
}

std::string tss_wallet_service::aggregate_keys(const std::vector<std::string>& keys)
{
    return to_string(_signing_service.aggregate_keys(parse_pubkeys(keys)));
}

agg_step_one_result tss_wallet_service::agg_send_step_one(const std::string& keypair, double amount, const std::string& to, const std::optional<std::string>& memo,
    const std::string& recent_block_hash, const std::vector<std::string>& keys)
{
    ed25519_keypair signer = parse_keypair(keypair);
    elliptic_curve_point destination = parse_pubkey(to);
    solana_hash_t block_hash = parse_hash(recent_block_hash);
    std::vector<elliptic_curve_point> pubkeys = parse_pubkeys(keys);

    elliptic_curve_point aggregated_key = _signing_service.aggregate_keys(pubkeys);
    return start_aggregated(signer, create_unsigned_transfer(amount, destination, memo, aggregated_key, block_hash), pubkeys);
}

agg_step_one_result tss_wallet_service::spl_agg_send_step_one(const std::string& keypair, double amount, uint8_t decimals, const std::string& to, const std::string& token_mint,
    const std::optional<std::string>& memo, const std::string& recent_block_hash, const std::vector<std::string>& keys)
{
    ed25519_keypair signer = parse_keypair(keypair);
    elliptic_curve_point destination = parse_pubkey(to);
    elliptic_curve_point mint = parse_pubkey(token_mint);
    solana_hash_t block_hash = parse_hash(recent_block_hash);
    std::vector<elliptic_curve_point> pubkeys = parse_pubkeys(keys);

    elliptic_curve_point aggregated_key = _signing_service.aggregate_keys(pubkeys);
    return start_aggregated(signer, create_unsigned_spl_transfer(amount, decimals, destination, mint, memo, true, aggregated_key, block_hash), pubkeys);
}

agg_step_one_result tss_wallet_service::agg_stake_step_one(const std::string& keypair, double amount, uint64_t rent_exempt_lamports, const std::string& seed, const std::string& vote_account,
    const std::string& recent_block_hash, const std::vector<std::string>& keys)
{
    ed25519_keypair signer = parse_keypair(keypair);
    elliptic_curve_point vote = parse_pubkey(vote_account);
    solana_hash_t block_hash = parse_hash(recent_block_hash);
    std::vector<elliptic_curve_point> pubkeys = parse_pubkeys(keys);

    elliptic_curve_point aggregated_key = _signing_service.aggregate_keys(pubkeys);
    return start_aggregated(signer, create_unsigned_stake_account(sol_to_lamports(amount), rent_exempt_lamports, seed, aggregated_key, vote, block_hash), pubkeys);
}

agg_step_one_result tss_wallet_service::agg_deactivate_stake_step_one(const std::string& keypair, const std::string& stake_account, const std::string& recent_block_hash, const std::vector<std::string>& keys)
{
    ed25519_keypair signer = parse_keypair(keypair);
    elliptic_curve_point account = parse_pubkey(stake_account);
    solana_hash_t block_hash = parse_hash(recent_block_hash);
    std::vector<elliptic_curve_point> pubkeys = parse_pubkeys(keys);

    elliptic_curve_point aggregated_key = _signing_service.aggregate_keys(pubkeys);
    return start_aggregated(signer, create_unsigned_deactivate_stake(account, aggregated_key, block_hash), pubkeys);
}

agg_step_one_result tss_wallet_service::agg_withdraw_stake_step_one(const std::string& keypair, const std::string& stake_account, const std::string& to, double amount,
    const std::string& recent_block_hash, const std::vector<std::string>& keys)
{
    ed25519_keypair signer = parse_keypair(keypair);
    elliptic_curve_point account = parse_pubkey(stake_account);
    elliptic_curve_point destination = parse_pubkey(to);
    solana_hash_t block_hash = parse_hash(recent_block_hash);
    std::vector<elliptic_curve_point> pubkeys = parse_pubkeys(keys);

    elliptic_curve_point aggregated_key = _signing_service.aggregate_keys(pubkeys);
    return start_aggregated(signer, create_unsigned_withdraw_stake(account, destination, aggregated_key, sol_to_lamports(amount), block_hash), pubkeys);
}

agg_step_one_result tss_wallet_service::start_aggregated(const ed25519_keypair& signer, const solana_transaction& tx, const std::vector<elliptic_curve_point>& keys)
{
    signing_start_result start = _signing_service.start_signing(tx.message.serialize(), keys, signer.public_key);

    agg_step_one_result ret;
    ret.session_id = start.session_id;
    if (_signing_service.config().nonce_exchange == common::cosigner::COMMIT_REVEAL_NONCE_EXCHANGE)
        ret.nonce_commitment = base58_encode((const uint8_t*)&start.nonce_commitment.data, sizeof(commitments_commitment_t));
    else
        ret.nonce_point = to_string(start.nonce_point);
    return ret;
}

std::string tss_wallet_service::agg_send_reveal_nonce(const std::string& session_id, const std::map<std::string, std::string>& commitments)
{
    std::map<elliptic_curve_point, commitment> parsed;
    for (auto i = commitments.begin(); i != commitments.end(); ++i)
    {
        commitment commit;
        base58_decode_fixed(i->second, (uint8_t*)&commit.data, sizeof(commitments_commitment_t));
        parsed[parse_pubkey(i->first)] = commit;
    }
    return to_string(_signing_service.store_commitments(session_id, parsed));
}

agg_step_two_result tss_wallet_service::agg_send_step_two(const std::string& keypair, const std::string& session_id, const std::map<std::string, std::string>& remote_nonce_points)
{
    ed25519_keypair signer = parse_keypair(keypair);
    std::map<elliptic_curve_point, elliptic_curve_point> points;
    for (auto i = remote_nonce_points.begin(); i != remote_nonce_points.end(); ++i)
        points[parse_pubkey(i->first)] = parse_pubkey(i->second);

    partial_signature_result partial = _signing_service.partial_sign(session_id, points, signer);

    agg_step_two_result ret;
    ret.aggregate_nonce_point = to_string(partial.aggregate_nonce_point);
    ret.partial_signature = base58_encode(partial.partial_signature.data, sizeof(ed25519_le_scalar_t));
    return ret;
}

agg_signatures_result tss_wallet_service::aggregate_signatures(const std::string& session_id, const std::map<std::string, std::string>& partial_signatures, solana_network network)
{
    std::map<elliptic_curve_point, elliptic_curve_scalar> signatures;
    for (auto i = partial_signatures.begin(); i != partial_signatures.end(); ++i)
    {
        elliptic_curve_scalar s;
        base58_decode_fixed(i->second, s.data, sizeof(ed25519_le_scalar_t));
        signatures[parse_pubkey(i->first)] = s;
    }

    aggregated_signature_result result = _signing_service.aggregate_signatures(session_id, signatures);

    // the session only keeps the message, the transaction is rebuilt from it
    solana_transaction tx = solana_transaction::new_unsigned(solana_message::parse(result.message));
    agg_signatures_result ret;
    ret.signed_transaction = transaction_assembler::attach_signature(tx, result.aggregated_key, result.signature, result.message);

    ret.transaction_id = transaction_assembler::broadcast(_rpc, network, ret.signed_transaction);
    if (ret.transaction_id != tx.id())
        LOG_WARN("node reported transaction id %s, expected %s", ret.transaction_id.c_str(), tx.id().c_str());
    _rpc.confirm_transaction(ret.transaction_id, tx.message.recent_blockhash, network);
    return ret;
}

void tss_wallet_service::cancel(const std::string& session_id)
{
    _signing_service.cancel_signing(session_id);
}

}
}
}
