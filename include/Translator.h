// include/Translator.h

#ifndef TRANSLATOR_H
#define TRANSLATOR_H

#include <string>

namespace pkgreport {

    /// Message catalog lookup. Rendering code goes through this for every
    /// user-visible phrase and for count-dependent grammar.
    class Translator {
    public:
        virtual ~Translator() = default;

        virtual std::string translate(const char* msgid) const = 0;
        virtual std::string pluralize(const char* singular, const char* plural,
                                      unsigned long count) const = 0;
    };

    /// gettext-backed catalog. Without an installed catalog the msgids come
    /// back untouched (English, singular for exactly one).
    class GettextTranslator : public Translator {
    public:
        explicit GettextTranslator(std::string domain = "pkgreport");

        std::string translate(const char* msgid) const override;
        std::string pluralize(const char* singular, const char* plural,
                              unsigned long count) const override;

        /// Bind the domain to a locale directory; call once from main().
        static void bindDomain(const std::string& domain, const std::string& localeDir);

    private:
        std::string domain_;
    };

} // namespace pkgreport

#endif //TRANSLATOR_H
