#ifndef ROCKETPROPS_ERRORS_H
#define ROCKETPROPS_ERRORS_H

#include <stdexcept>
#include <string>

namespace rocketprops {

// base class of everything the library throws on purpose
class RocketPropsError : public std::runtime_error {
  public:
    explicit RocketPropsError(const std::string& what) : std::runtime_error(what) {}
};

// \brief: name or alias not present in the registry (and not a known mixture)
class UnknownSubstanceError : public RocketPropsError {
  public:
    explicit UnknownSubstanceError(const std::string& what) : RocketPropsError(what) {}
};

// \brief: correlation evaluated outside of its valid reduced temperature range
class DomainError : public RocketPropsError {
  public:
    DomainError(const std::string& what, double Tr, double Tr_min, double Tr_max)
      : RocketPropsError(what), Tr(Tr), Tr_min(Tr_min), Tr_max(Tr_max) {}
    double Tr, Tr_min, Tr_max;
};

// \brief: requested state outside the physical validity range of the property
class PhaseRangeError : public RocketPropsError {
  public:
    explicit PhaseRangeError(const std::string& what) : RocketPropsError(what) {}
};

// \brief: unit conversion across two different quantity families
class IncompatibleUnitError : public RocketPropsError {
  public:
    explicit IncompatibleUnitError(const std::string& what) : RocketPropsError(what) {}
};

// \brief: unit name not known to the converter
class UnknownUnitError : public IncompatibleUnitError {
  public:
    explicit UnknownUnitError(const std::string& what) : IncompatibleUnitError(what) {}
};

// \brief: malformed or inconsistent reference data
class DataError : public RocketPropsError {
  public:
    explicit DataError(const std::string& what) : RocketPropsError(what) {}
};

} // namespace rocketprops

#endif // ROCKETPROPS_ERRORS_H
