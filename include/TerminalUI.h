#pragma once
#include "Profile.h"

#include <ostream>

class TerminalUI {
public:
    static void printProfileSummary(const Profile& profile, std::ostream& out);
    static void printCategoricalSummary(const Profile& profile, size_t topCategories, std::ostream& out);
    static void printCorrelationMatrix(const CorrelationMatrix& matrix, std::ostream& out);
};
