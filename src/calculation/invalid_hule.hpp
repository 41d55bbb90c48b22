#if !defined(HULE_CALCULATION_INVALID_HULE_HPP_INCLUDE_GUARD)
#define HULE_CALCULATION_INVALID_HULE_HPP_INCLUDE_GUARD

#include <iosfwd>
#include <string>
#include <stdexcept>
#include <cstdint>


namespace Hule{

// Why a declared hand was rejected. The enumerators and their names are
// stable and reported to callers as they are.
enum struct RejectReason : std::uint_fast8_t
{
  // State conflicts.
  lizhi_and_double_lizhi,
  yifa_without_lizhi,
  menqian_with_fulu,
  haidi_with_rong,
  hedi_with_zimo,
  haidi_and_hedi,
  lingshang_with_rong,
  qianggang_with_zimo,
  tianhu_without_zhuangjia,
  tianhu_without_zimo,
  tianhu_with_calls,
  dihu_with_zhuangjia,
  dihu_without_zimo,
  dihu_with_calls,
  renhu_without_rong,

  // Composition.
  too_many_calls,
  wrong_number_of_tiles,
  hupai_not_in_hand,
  too_many_copies,
  too_many_hongbaopai_for_fives,
  too_many_hongbaopai,

  // Declared calls that the held tiles cannot account for.
  missing_angang,
  missing_peng,
  missing_minggang,
  missing_chi,
  invalid_chi,
  missing_quetou,

  // No pattern applies to the hand.
  no_pattern,
}; // enum struct RejectReason

char const *getRejectReasonName(RejectReason reason) noexcept;

std::ostream &operator<<(std::ostream &os, RejectReason reason);

class InvalidHule
  : public std::invalid_argument
{
public:
  InvalidHule(RejectReason reason, std::string const &what);

  InvalidHule(InvalidHule const &rhs) noexcept = default;

  InvalidHule &operator=(InvalidHule const &rhs) noexcept = default;

  RejectReason getReason() const noexcept;

private:
  RejectReason reason_;
}; // class InvalidHule

} // namespace Hule

#endif // !defined(HULE_CALCULATION_INVALID_HULE_HPP_INCLUDE_GUARD)
