#include "calculation/invalid_hule.hpp"

#include <ostream>
#include <string>
#include <stdexcept>


namespace Hule{

char const *getRejectReasonName(RejectReason const reason) noexcept
{
  switch (reason) {
  case RejectReason::lizhi_and_double_lizhi:
    return "lizhi_and_double_lizhi";
  case RejectReason::yifa_without_lizhi:
    return "yifa_without_lizhi";
  case RejectReason::menqian_with_fulu:
    return "menqian_with_fulu";
  case RejectReason::haidi_with_rong:
    return "haidi_with_rong";
  case RejectReason::hedi_with_zimo:
    return "hedi_with_zimo";
  case RejectReason::haidi_and_hedi:
    return "haidi_and_hedi";
  case RejectReason::lingshang_with_rong:
    return "lingshang_with_rong";
  case RejectReason::qianggang_with_zimo:
    return "qianggang_with_zimo";
  case RejectReason::tianhu_without_zhuangjia:
    return "tianhu_without_zhuangjia";
  case RejectReason::tianhu_without_zimo:
    return "tianhu_without_zimo";
  case RejectReason::tianhu_with_calls:
    return "tianhu_with_calls";
  case RejectReason::dihu_with_zhuangjia:
    return "dihu_with_zhuangjia";
  case RejectReason::dihu_without_zimo:
    return "dihu_without_zimo";
  case RejectReason::dihu_with_calls:
    return "dihu_with_calls";
  case RejectReason::renhu_without_rong:
    return "renhu_without_rong";
  case RejectReason::too_many_calls:
    return "too_many_calls";
  case RejectReason::wrong_number_of_tiles:
    return "wrong_number_of_tiles";
  case RejectReason::hupai_not_in_hand:
    return "hupai_not_in_hand";
  case RejectReason::too_many_copies:
    return "too_many_copies";
  case RejectReason::too_many_hongbaopai_for_fives:
    return "too_many_hongbaopai_for_fives";
  case RejectReason::too_many_hongbaopai:
    return "too_many_hongbaopai";
  case RejectReason::missing_angang:
    return "missing_angang";
  case RejectReason::missing_peng:
    return "missing_peng";
  case RejectReason::missing_minggang:
    return "missing_minggang";
  case RejectReason::missing_chi:
    return "missing_chi";
  case RejectReason::invalid_chi:
    return "invalid_chi";
  case RejectReason::missing_quetou:
    return "missing_quetou";
  case RejectReason::no_pattern:
    return "no_pattern";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, RejectReason const reason)
{
  return os << getRejectReasonName(reason);
}

InvalidHule::InvalidHule(RejectReason const reason, std::string const &what)
  : std::invalid_argument(std::string(getRejectReasonName(reason)) + ": " + what),
    reason_(reason)
{}

RejectReason InvalidHule::getReason() const noexcept
{
  return reason_;
}

} // namespace Hule
