#include <cctype>
#include <sitebook/ledger/types.hpp>

namespace sitebook::ledger {

    const char *toString(CompanyKind v) {
        switch (v) {
        case CompanyKind::Person:
            return "person";
        case CompanyKind::Organization:
            return "company";
        }
        return "company";
    }

    const char *toString(CompanyRole v) {
        switch (v) {
        case CompanyRole::Customer:
            return "customer";
        case CompanyRole::Supplier:
            return "supplier";
        case CompanyRole::Subcontractor:
            return "subcontractor";
        case CompanyRole::Investor:
            return "investor";
        }
        return "customer";
    }

    const char *toString(Ownership v) { return v == Ownership::Client ? "client" : "own"; }

    const char *toString(ProjectStatus v) {
        switch (v) {
        case ProjectStatus::Planned:
            return "planned";
        case ProjectStatus::Active:
            return "active";
        case ProjectStatus::Completed:
            return "completed";
        case ProjectStatus::Cancelled:
            return "cancelled";
        }
        return "planned";
    }

    const char *toString(CategoryType v) {
        switch (v) {
        case CategoryType::InvoiceOut:
            return "invoice_out";
        case CategoryType::InvoiceIn:
            return "invoice_in";
        case CategoryType::Payment:
            return "payment";
        }
        return "payment";
    }

    const char *toString(Scope v) {
        switch (v) {
        case Scope::Cari:
            return "cari";
        case Scope::Project:
            return "project";
        case Scope::Company:
            return "company";
        }
        return "cari";
    }

    const char *toString(TxType v) {
        switch (v) {
        case TxType::InvoiceOut:
            return "invoice_out";
        case TxType::PaymentIn:
            return "payment_in";
        case TxType::InvoiceIn:
            return "invoice_in";
        case TxType::PaymentOut:
            return "payment_out";
        }
        return "invoice_out";
    }

    const char *toString(Currency v) {
        switch (v) {
        case Currency::Base:
            return "base";
        case Currency::Alt1:
            return "alt1";
        case Currency::Alt2:
            return "alt2";
        }
        return "base";
    }

    const char *toString(TrashKind v) {
        switch (v) {
        case TrashKind::Company:
            return "company";
        case TrashKind::Project:
            return "project";
        case TrashKind::Transaction:
            return "transaction";
        }
        return "transaction";
    }

    // Linear lookup over an enum's value range using its toString
    template <typename E> static std::optional<E> parseEnum(const std::string &s, int count) {
        for (int i = 0; i < count; ++i) {
            E v = static_cast<E>(i);
            if (s == toString(v))
                return v;
        }
        return std::nullopt;
    }

    std::optional<CompanyKind> parseCompanyKind(const std::string &s) { return parseEnum<CompanyKind>(s, 2); }
    std::optional<CompanyRole> parseCompanyRole(const std::string &s) { return parseEnum<CompanyRole>(s, 4); }
    std::optional<Ownership> parseOwnership(const std::string &s) { return parseEnum<Ownership>(s, 2); }
    std::optional<ProjectStatus> parseProjectStatus(const std::string &s) { return parseEnum<ProjectStatus>(s, 4); }
    std::optional<CategoryType> parseCategoryType(const std::string &s) { return parseEnum<CategoryType>(s, 3); }
    std::optional<Scope> parseScope(const std::string &s) { return parseEnum<Scope>(s, 3); }
    std::optional<TxType> parseTxType(const std::string &s) { return parseEnum<TxType>(s, 4); }
    std::optional<Currency> parseCurrency(const std::string &s) { return parseEnum<Currency>(s, 3); }
    std::optional<TrashKind> parseTrashKind(const std::string &s) { return parseEnum<TrashKind>(s, 3); }

    bool isIsoDate(const std::string &s) {
        if (s.size() != 10 || s[4] != '-' || s[7] != '-')
            return false;
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(s[i])))
                return false;
        }
        int year = std::stoi(s.substr(0, 4));
        int month = std::stoi(s.substr(5, 2));
        int day = std::stoi(s.substr(8, 2));
        if (month < 1 || month > 12 || day < 1)
            return false;

        static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        int last = kDaysInMonth[month - 1] + ((month == 2 && leap) ? 1 : 0);
        return day <= last;
    }

} // namespace sitebook::ledger
