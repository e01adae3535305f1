// =============================================================================
// address.cpp - Program derived and associated token address derivation
// =============================================================================

#include "cpamm/address.hpp"
#include <openssl/sha.h>
#include <cstring>
#include <stdexcept>

namespace cpamm {

namespace {

using U128 = unsigned __int128;

constexpr char PDA_MARKER[] = "ProgramDerivedAddress";

// =============================================================================
// GF(2^255 - 19) Arithmetic (five 51-bit limbs)
// =============================================================================

constexpr uint64_t MASK51 = (uint64_t(1) << 51) - 1;

struct Fe {
    uint64_t v[5];
};

inline uint64_t load64_le(const uint8_t* p) {
    uint64_t r = 0;
    for (int i = 7; i >= 0; --i) r = (r << 8) | p[i];
    return r;
}

inline Fe fe_small(uint64_t x) {
    return Fe{{x, 0, 0, 0, 0}};
}

// Top bit (x sign) is ignored; non-canonical y is reduced implicitly
inline Fe fe_from_bytes(const uint8_t* s) {
    uint64_t w0 = load64_le(s);
    uint64_t w1 = load64_le(s + 8);
    uint64_t w2 = load64_le(s + 16);
    uint64_t w3 = load64_le(s + 24);

    Fe h;
    h.v[0] = w0 & MASK51;
    h.v[1] = ((w0 >> 51) | (w1 << 13)) & MASK51;
    h.v[2] = ((w1 >> 38) | (w2 << 26)) & MASK51;
    h.v[3] = ((w2 >> 25) | (w3 << 39)) & MASK51;
    h.v[4] = (w3 >> 12) & MASK51;
    return h;
}

inline void fe_carry(Fe& h) {
    uint64_t c;
    c = h.v[0] >> 51; h.v[0] &= MASK51; h.v[1] += c;
    c = h.v[1] >> 51; h.v[1] &= MASK51; h.v[2] += c;
    c = h.v[2] >> 51; h.v[2] &= MASK51; h.v[3] += c;
    c = h.v[3] >> 51; h.v[3] &= MASK51; h.v[4] += c;
    c = h.v[4] >> 51; h.v[4] &= MASK51; h.v[0] += c * 19;
    c = h.v[0] >> 51; h.v[0] &= MASK51; h.v[1] += c;
}

inline Fe fe_add(const Fe& a, const Fe& b) {
    Fe r;
    for (int i = 0; i < 5; ++i) r.v[i] = a.v[i] + b.v[i];
    fe_carry(r);
    return r;
}

// a + 2p - b keeps every limb non-negative
inline Fe fe_sub(const Fe& a, const Fe& b) {
    Fe r;
    r.v[0] = a.v[0] + 0xFFFFFFFFFFFDAULL - b.v[0];
    r.v[1] = a.v[1] + 0xFFFFFFFFFFFFEULL - b.v[1];
    r.v[2] = a.v[2] + 0xFFFFFFFFFFFFEULL - b.v[2];
    r.v[3] = a.v[3] + 0xFFFFFFFFFFFFEULL - b.v[3];
    r.v[4] = a.v[4] + 0xFFFFFFFFFFFFEULL - b.v[4];
    fe_carry(r);
    return r;
}

inline Fe fe_mul(const Fe& a, const Fe& b) {
    const uint64_t a0 = a.v[0], a1 = a.v[1], a2 = a.v[2], a3 = a.v[3], a4 = a.v[4];
    const uint64_t b0 = b.v[0], b1 = b.v[1], b2 = b.v[2], b3 = b.v[3], b4 = b.v[4];
    const uint64_t b1_19 = b1 * 19, b2_19 = b2 * 19, b3_19 = b3 * 19, b4_19 = b4 * 19;

    U128 t0 = (U128)a0 * b0 + (U128)a1 * b4_19 + (U128)a2 * b3_19 + (U128)a3 * b2_19 + (U128)a4 * b1_19;
    U128 t1 = (U128)a0 * b1 + (U128)a1 * b0 + (U128)a2 * b4_19 + (U128)a3 * b3_19 + (U128)a4 * b2_19;
    U128 t2 = (U128)a0 * b2 + (U128)a1 * b1 + (U128)a2 * b0 + (U128)a3 * b4_19 + (U128)a4 * b3_19;
    U128 t3 = (U128)a0 * b3 + (U128)a1 * b2 + (U128)a2 * b1 + (U128)a3 * b0 + (U128)a4 * b4_19;
    U128 t4 = (U128)a0 * b4 + (U128)a1 * b3 + (U128)a2 * b2 + (U128)a3 * b1 + (U128)a4 * b0;

    t1 += t0 >> 51; t0 &= MASK51;
    t2 += t1 >> 51; t1 &= MASK51;
    t3 += t2 >> 51; t2 &= MASK51;
    t4 += t3 >> 51; t3 &= MASK51;
    t0 += (t4 >> 51) * 19; t4 &= MASK51;
    t1 += t0 >> 51; t0 &= MASK51;

    return Fe{{static_cast<uint64_t>(t0), static_cast<uint64_t>(t1), static_cast<uint64_t>(t2),
               static_cast<uint64_t>(t3), static_cast<uint64_t>(t4)}};
}

// Fully reduced representative in [0, p)
inline Fe fe_canonical(const Fe& a) {
    Fe h = a;
    fe_carry(h);
    fe_carry(h);

    // q = 1 iff h >= p
    uint64_t q = (h.v[0] + 19) >> 51;
    q = (h.v[1] + q) >> 51;
    q = (h.v[2] + q) >> 51;
    q = (h.v[3] + q) >> 51;
    q = (h.v[4] + q) >> 51;

    h.v[0] += 19 * q;
    uint64_t c;
    c = h.v[0] >> 51; h.v[0] &= MASK51; h.v[1] += c;
    c = h.v[1] >> 51; h.v[1] &= MASK51; h.v[2] += c;
    c = h.v[2] >> 51; h.v[2] &= MASK51; h.v[3] += c;
    c = h.v[3] >> 51; h.v[3] &= MASK51; h.v[4] += c;
    h.v[4] &= MASK51;
    return h;
}

inline bool fe_equal(const Fe& a, const Fe& b) {
    Fe x = fe_canonical(a);
    Fe y = fe_canonical(b);
    for (int i = 0; i < 5; ++i) {
        if (x.v[i] != y.v[i]) return false;
    }
    return true;
}

inline bool fe_is_zero(const Fe& a) {
    return fe_equal(a, fe_small(0));
}

// Square-and-multiply; exponent is 32 little-endian bytes
Fe fe_pow(const Fe& base, const std::array<uint8_t, 32>& exp) {
    Fe r = fe_small(1);
    for (int i = 255; i >= 0; --i) {
        r = fe_mul(r, r);
        if ((exp[i / 8] >> (i % 8)) & 1) r = fe_mul(r, base);
    }
    return r;
}

std::array<uint8_t, 32> make_exponent(uint8_t low, uint8_t high) {
    std::array<uint8_t, 32> e;
    e.fill(0xFF);
    e[0] = low;
    e[31] = high;
    return e;
}

// p - 2 = 2^255 - 21
const std::array<uint8_t, 32> EXP_INVERT = make_exponent(0xEB, 0x7F);
// (p - 1) / 2 = 2^254 - 10
const std::array<uint8_t, 32> EXP_LEGENDRE = make_exponent(0xF6, 0x3F);

// Edwards d = -121665 / 121666
Fe edwards_d() {
    Fe inv = fe_pow(fe_small(121666), EXP_INVERT);
    return fe_sub(fe_small(0), fe_mul(fe_small(121665), inv));
}

const Fe ED_D = edwards_d();

// =============================================================================
// Hashing
// =============================================================================

Pubkey sha256(const std::vector<uint8_t>& data) {
    Pubkey out;
    SHA256(data.data(), data.size(), out.bytes.data());
    return out;
}

} // namespace

// =============================================================================
// Program Identities
// =============================================================================

ProgramIds ProgramIds::defaults() {
    auto token = Pubkey::from_base58(programs::TOKEN_PROGRAM_ID);
    auto ata = Pubkey::from_base58(programs::ASSOCIATED_TOKEN_PROGRAM_ID);
    if (!token || !ata) {
        throw std::logic_error("invalid built-in program id");
    }
    return ProgramIds{*token, *ata};
}

// =============================================================================
// Curve Check
// =============================================================================

bool is_on_curve(const Pubkey& key) {
    const Fe one = fe_small(1);
    Fe y = fe_from_bytes(key.bytes.data());
    Fe y2 = fe_mul(y, y);
    Fe u = fe_sub(y2, one);
    Fe v = fe_add(fe_mul(ED_D, y2), one);

    if (fe_is_zero(v)) return fe_is_zero(u);

    // x^2 = u / v has a root iff u * v is a square
    Fe chi = fe_pow(fe_mul(u, v), EXP_LEGENDRE);
    return fe_is_zero(chi) || fe_equal(chi, one);
}

// =============================================================================
// Derivation
// =============================================================================

std::optional<Pubkey> create_program_address(const std::vector<Seed>& seeds,
                                             const Pubkey& program_id) {
    if (seeds.size() > MAX_SEEDS) return std::nullopt;

    std::vector<uint8_t> buf;
    buf.reserve(seeds.size() * MAX_SEED_LEN + 32 + sizeof(PDA_MARKER));
    for (const auto& seed : seeds) {
        if (seed.size() > MAX_SEED_LEN) return std::nullopt;
        buf.insert(buf.end(), seed.begin(), seed.end());
    }
    buf.insert(buf.end(), program_id.bytes.begin(), program_id.bytes.end());
    buf.insert(buf.end(), PDA_MARKER, PDA_MARKER + std::strlen(PDA_MARKER));

    Pubkey address = sha256(buf);
    if (is_on_curve(address)) return std::nullopt;
    return address;
}

std::optional<std::pair<Pubkey, uint8_t>> find_program_address(const std::vector<Seed>& seeds,
                                                               const Pubkey& program_id) {
    std::vector<Seed> with_bump = seeds;
    with_bump.push_back(Seed{0});

    for (int bump = 255; bump > 0; --bump) {
        with_bump.back()[0] = static_cast<uint8_t>(bump);
        auto address = create_program_address(with_bump, program_id);
        if (address) return std::make_pair(*address, static_cast<uint8_t>(bump));
    }
    return std::nullopt;
}

std::optional<Pubkey> associated_token_address(const Pubkey& owner,
                                               const Pubkey& mint,
                                               const ProgramIds& ids) {
    std::vector<Seed> seeds = {
        Seed(owner.bytes.begin(), owner.bytes.end()),
        Seed(ids.token_program.bytes.begin(), ids.token_program.bytes.end()),
        Seed(mint.bytes.begin(), mint.bytes.end()),
    };
    auto found = find_program_address(seeds, ids.associated_token_program);
    if (!found) return std::nullopt;
    return found->first;
}

} // namespace cpamm
