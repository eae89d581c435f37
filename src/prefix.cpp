#include <gtin/prefix.hpp>

#include <gtin/normalize.hpp>

#include <algorithm>
#include <iterator>

namespace gtin {

namespace {

struct PrefixRange {
  int first;  // inclusive
  int last;   // inclusive
};

// Reserved 3-digit prefixes for GTIN-12/13/14.
constexpr PrefixRange kReservedRanges[] = {
    {20, 29},     // GS1 prefix 02: restricted distribution
    {40, 59},     // GS1 prefixes 04, 05: in-company numbers, coupons
    {200, 299},   // restricted circulation numbers
    {960, 969},   // GS1 Global Office, GTIN-8 allocations
    {980, 999},   // refund receipts, coupons
};

// RCN-8: GTIN-8 codes starting with 0 or 2.
constexpr PrefixRange kReservedGtin8Ranges[] = {
    {0, 99},
    {200, 299},
};

// Reserved or unassigned single prefixes (n1 <= 8). Sorted ascending.
constexpr int kReservedPrefixes[] = {
    381, 382, 384, 386, 388, 390, 391, 392, 393, 394,
    395, 396, 397, 398, 399, 441, 442, 443, 444, 445,
    446, 447, 448, 449, 472, 473, 510, 511, 512, 513,
    514, 515, 516, 517, 518, 519, 522, 523, 524, 525,
    526, 527, 532, 533, 534, 536, 537, 538, 550, 551,
    552, 553, 554, 555, 556, 557, 558, 559, 561, 562,
    563, 564, 565, 566, 567, 568, 580, 581, 582, 583,
    584, 585, 586, 587, 588, 589, 591, 592, 593, 595,
    596, 597, 598, 602, 605, 606, 607, 610, 612, 614,
    617, 630, 631, 632, 633, 634, 635, 636, 637, 638,
    639, 650, 651, 652, 653, 654, 655, 656, 657, 658,
    659, 660, 661, 662, 663, 664, 665, 666, 667, 668,
    669, 670, 671, 672, 673, 674, 675, 676, 677, 678,
    679, 680, 681, 682, 683, 684, 685, 686, 687, 688,
    689, 710, 711, 712, 713, 714, 715, 716, 717, 718,
    719, 720, 721, 722, 723, 724, 725, 726, 727, 728,
    747, 748, 749, 751, 752, 753, 756, 757, 758, 772,
    774, 776, 781, 782, 783, 785, 787, 788, 791, 792,
    793, 794, 795, 796, 797, 798, 799, 851, 852, 853,
    854, 855, 856, 857, 861, 862, 863, 864, 866, 881,
    882, 883, 886, 887, 889, 891, 892, 894, 895, 897,
    898, 920, 921, 922, 923, 924, 925, 926, 927, 928,
    929,
};

template <size_t N>
bool InAnyRange(const PrefixRange (&ranges)[N], int prefix) {
  return std::any_of(std::begin(ranges), std::end(ranges),
                     [prefix](const PrefixRange& r) {
                       return prefix >= r.first && prefix <= r.last;
                     });
}

}  // namespace

namespace internal {

bool IsReservedPrefix(int prefix) {
  if (InAnyRange(kReservedRanges, prefix)) {
    return true;
  }
  return std::binary_search(std::begin(kReservedPrefixes),
                            std::end(kReservedPrefixes), prefix);
}

bool IsReservedGtin8Prefix(int prefix) {
  return InAnyRange(kReservedGtin8Ranges, prefix);
}

std::optional<int> ParsePrefixWindow(std::string_view window) {
  size_t start = 0;
  size_t end = window.size();
  while (start < end && IsWhitespace(window[start])) ++start;
  while (end > start && IsWhitespace(window[end - 1])) --end;

  bool negative = false;
  if (start < end && (window[start] == '+' || window[start] == '-')) {
    negative = (window[start] == '-');
    ++start;
  }
  if (start == end || end - start > kMaxPrefixWindowDigits) {
    return std::nullopt;
  }

  int value = 0;
  for (size_t i = start; i < end; ++i) {
    const char c = window[i];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  return negative ? -value : value;
}

}  // namespace internal

bool IsPrefixAllowed(const CodeInput& input) {
  const std::string& raw = input.raw();

  switch (raw.size()) {
    case 8: {
      auto prefix =
          internal::ParsePrefixWindow(std::string_view(raw).substr(0, 3));
      if (!prefix) return false;
      return !internal::IsReservedGtin8Prefix(*prefix);
    }
    case 12:
    case 13:
    case 14: {
      const std::string canonical = Normalize(input, kValidationWidth);
      const char n1 = canonical[0];
      if (n1 < '0' || n1 > '9') return false;
      if (n1 > '8') return false;

      auto prefix =
          internal::ParsePrefixWindow(std::string_view(canonical).substr(1, 3));
      if (!prefix) return false;
      return !internal::IsReservedPrefix(*prefix);
    }
    default:
      return false;
  }
}

}  // namespace gtin
