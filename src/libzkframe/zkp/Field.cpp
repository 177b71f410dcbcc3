#include "Field.h"

#include <cctype>
#include <gmpxx.h>

namespace zkframe {
namespace zkp {

void
initializeCurve()
{
    static bool initialized = false;
    if (!initialized)
    {
        DefaultCurve::init_public_params();
        initialized = true;
    }
}

bool
parseFieldLiteral(std::string const& text, FieldT& out)
{
    std::size_t const start = (!text.empty() && text[0] == '-') ? 1 : 0;
    if (start == text.size())
        return false;

    for (std::size_t i = start; i < text.size(); ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(text[i])))
            return false;
    }

    mpz_class magnitude;
    if (magnitude.set_str(text.substr(start), 10) != 0)
        return false;

    mpz_class modulus;
    FieldT::mod.to_mpz(modulus.get_mpz_t());
    if (magnitude >= modulus)
        return false;

    out = FieldT(libff::bigint<FieldT::num_limbs>(magnitude.get_mpz_t()));
    if (start == 1)
        out = -out;
    return true;
}

std::string
toDecimalString(FieldT const& value)
{
    mpz_class result;
    value.as_bigint().to_mpz(result.get_mpz_t());
    return result.get_str(10);
}

bool
isBoolean(FieldT const& value)
{
    return value == FieldT::zero() || value == FieldT::one();
}

}  // namespace zkp
}  // namespace zkframe
