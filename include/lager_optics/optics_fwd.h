// optics_fwd.h - Forward declarations for lager_optics accessor types

#pragma once

namespace lager_optics {

template<typename S, typename A>
class Lens;

template<typename S, typename A>
class Traversal;

template<typename S, typename A>
class Program;

template<typename Dep>
struct DepartmentCapability;

template<typename Univ, typename Dep>
struct UniversityCapability;

template<typename Univ>
struct IndexedUniversityCapability;

} // namespace lager_optics
