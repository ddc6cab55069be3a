#pragma once

#include <iterator>
#include <type_traits>

#include "aux/chunk.hpp"

namespace binfind::detail
{

template <typename Iterator>
constexpr bool is_random_access_iterator =
    std::is_same<std::random_access_iterator_tag, typename std::iterator_traits<Iterator>::iterator_category>::value;

template <typename Iterator>
constexpr bool is_byte_iterator =
    std::is_same<byte_t, typename std::remove_cv<typename std::iterator_traits<Iterator>::value_type>::type>::value;

template <typename Iterator>
constexpr bool is_random_access_byte_iterator = is_random_access_iterator<Iterator> && is_byte_iterator<Iterator>;

} // namespace binfind::detail
