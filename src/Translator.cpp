// src/Translator.cpp

#include "Translator.h"

#include <libintl.h>
#include <utility>

namespace pkgreport {

    GettextTranslator::GettextTranslator(std::string domain)
      : domain_(std::move(domain)) {}

    std::string GettextTranslator::translate(const char* msgid) const {
        return dgettext(domain_.c_str(), msgid);
    }

    std::string GettextTranslator::pluralize(const char* singular, const char* plural,
                                             unsigned long count) const {
        return dngettext(domain_.c_str(), singular, plural, count);
    }

    void GettextTranslator::bindDomain(const std::string& domain, const std::string& localeDir) {
        bindtextdomain(domain.c_str(), localeDir.c_str());
        bind_textdomain_codeset(domain.c_str(), "UTF-8");
    }

} // namespace pkgreport
