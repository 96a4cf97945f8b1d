#pragma once

// Passages of U.S. law shared by the selector tests.

#include <string_view>

namespace anchorpoint_cpp::testing {

// 17 U.S.C. 102(a)
inline constexpr std::string_view legal_text =
    "Copyright protection subsists, in accordance with this title, in original "
    "works of authorship fixed in any tangible medium of expression, now known "
    "or later developed, from which they can be perceived, reproduced, or "
    "otherwise communicated, either directly or with the aid of a machine or "
    "device. Works of authorship include the following categories:";

// 17 U.S.C. 102(b)
inline constexpr std::string_view s102b =
    "In no case does copyright protection for an original work of authorship "
    "extend to any idea, procedure, process, system, method of operation, "
    "concept, principle, or discovery, regardless of the form in which it is "
    "described, explained, illustrated, or embodied in such work.";

// U.S. Const. amend. XIV, section 1
inline constexpr std::string_view amendment =
    "All persons born or naturalized in the United States and subject to the "
    "jurisdiction thereof, are citizens of the United States and of the State "
    "wherein they reside. No State shall make or enforce any law which shall "
    "abridge the privileges or immunities of citizens of the United States; "
    "nor shall any State deprive any person of life, liberty, or property, "
    "without due process of law; nor deny to any person within its "
    "jurisdiction the equal protection of the laws.";

}  // namespace anchorpoint_cpp::testing
