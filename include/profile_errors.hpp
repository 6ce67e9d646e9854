#ifndef PROFILE_ERRORS_HPP
#define PROFILE_ERRORS_HPP
#include <stdexcept>
#include <string>

// Every failure that aborts a body-model evaluation derives from ProfileError, so an
// orchestrator can tell model failures apart from programming errors.
struct ProfileError : public std::runtime_error {
  explicit ProfileError(const std::string &what) : std::runtime_error(what) {}
};

// No EOS source is registered for the requested composition.
struct UnsupportedComposition : public ProfileError {
  explicit UnsupportedComposition(const std::string &what) : ProfileError(what) {}
};

// Degenerate pressure/temperature bounds (max <= min, non-positive step, NaN).
struct PhysicallyInvalidRange : public ProfileError {
  explicit PhysicallyInvalidRange(const std::string &what) : ProfileError(what) {}
};

// Query outside the sampled bounds of an EOS built without extrapolation.
struct EOSRangeError : public ProfileError {
  explicit EOSRangeError(const std::string &what) : ProfileError(what) {}
};

struct NoFreezePressureFound : public ProfileError {
  explicit NoFreezePressureFound(const std::string &what) : ProfileError(what) {}
};

struct NoUnderplatePressure : public ProfileError {
  explicit NoUnderplatePressure(const std::string &what) : ProfileError(what) {}
};

// The ocean seam row was already tagged solid: layer counts upstream are wrong.
struct PhaseAssignmentError : public ProfileError {
  explicit PhaseAssignmentError(const std::string &what) : ProfileError(what) {}
};

struct NoMoIMatch : public ProfileError {
  explicit NoMoIMatch(const std::string &what) : ProfileError(what) {}
};

// Raised only when every inner-layer candidate exceeded the body mass.
struct MassExceededError : public ProfileError {
  explicit MassExceededError(const std::string &what) : ProfileError(what) {}
};

#endif // PROFILE_ERRORS_HPP
