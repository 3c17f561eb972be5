#include "entente/diplo/Traits.h"

#include <cctype>

namespace entente::diplo {

const char* traitName(Trait t) {
  switch (t) {
    case Trait::Pragmatism: return "pragmatism";
    case Trait::Integrity: return "integrity";
    case Trait::Ambition: return "ambition";
    case Trait::Impulsivity: return "impulsivity";
    case Trait::Discipline: return "discipline";
  }
  return "unknown";
}

bool tryParseTrait(std::string_view text, Trait& out) {
  std::string k;
  k.reserve(text.size());
  for (const char c : text) k.push_back((char)std::tolower((unsigned char)c));

  constexpr std::string_view prefix = "hidden_";
  if (k.rfind(prefix, 0) == 0) k.erase(0, prefix.size());

  for (int i = 0; i < kTraitCount; ++i) {
    const Trait t = static_cast<Trait>(i);
    if (k == traitName(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

int TraitVector::get(Trait t) const {
  switch (t) {
    case Trait::Pragmatism: return pragmatism;
    case Trait::Integrity: return integrity;
    case Trait::Ambition: return ambition;
    case Trait::Impulsivity: return impulsivity;
    case Trait::Discipline: return discipline;
  }
  return 0;
}

void TraitVector::set(Trait t, int value) {
  switch (t) {
    case Trait::Pragmatism: pragmatism = value; break;
    case Trait::Integrity: integrity = value; break;
    case Trait::Ambition: ambition = value; break;
    case Trait::Impulsivity: impulsivity = value; break;
    case Trait::Discipline: discipline = value; break;
  }
}

bool operator==(const TraitVector& a, const TraitVector& b) {
  return a.pragmatism == b.pragmatism && a.integrity == b.integrity && a.ambition == b.ambition &&
         a.impulsivity == b.impulsivity && a.discipline == b.discipline;
}

bool validateTraits(const TraitVector& t, std::string* outError) {
  for (int i = 0; i < kTraitCount; ++i) {
    const Trait tr = static_cast<Trait>(i);
    const int v = t.get(tr);
    if (v < kTraitMin || v > kTraitMax) {
      if (outError) {
        *outError = std::string("trait ") + traitName(tr) + " out of range (" + std::to_string(v) + ", expected 0..10)";
      }
      return false;
    }
  }
  return true;
}

} // namespace entente::diplo
