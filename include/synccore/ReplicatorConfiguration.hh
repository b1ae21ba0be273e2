//
// ReplicatorConfiguration.hh
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "synccore/Database.hh"
#include "synccore/ReplicatorTypes.hh"
#include "fleece/Fleece.hh"
#include "fleece/Expert.hh"  // for AllocedDict
#include "fleece/function_ref.hh"
#include <chrono>
#include <map>
#include <memory>
#include <variant>
#include <vector>

namespace synccore {

#pragma mark - ENDPOINTS:

    /** A remote database, identified by a `ws:`, `wss:`, `http:` or `https:` URL. */
    struct URLEndpoint {
        std::string scheme;  // lowercase
        std::string host;    // without brackets, for IPv6 literals
        uint16_t    port{0};
        std::string path;    // always begins with '/'

        // The user info of the URL, if any; it is not part of `url()`.
        std::string username;
        std::string password;

        /// Parses a URL. Throws a Network `kNetErrInvalidURL` error if it's not a valid replication URL.
        explicit URLEndpoint(std::string_view url);

        /// True for `wss` and `https`.
        bool isSecure() const;

        /// The remote database name: the last component of the path.
        std::string databaseName() const;

        /// The URL, without any user info.
        std::string url() const;
    };

    /** Another local database. */
    struct DatabaseEndpoint {
        Retained<Database> database;
    };

    using Endpoint = std::variant<URLEndpoint, DatabaseEndpoint>;

    /** A short human-readable description of an endpoint (its URL or database name.) */
    std::string describe(const Endpoint&);

#pragma mark - OPTIONS:

    /** Protocol options of a replicator, stored as a Fleece dictionary that is handed to the
        sync engine. Options are frozen when a session starts, after which all setters throw
        `NotWriteable`. A copy of frozen options is not frozen. */
    class ReplicatorOptions {
      public:
        ReplicatorOptions() = default;
        ReplicatorOptions(const ReplicatorOptions&);
        ReplicatorOptions& operator=(const ReplicatorOptions&);

        //---- Accessors:

        std::vector<std::string>           channels() const { return stringArray(kReplicatorOptionChannels); }
        std::vector<std::string>           documentIDs() const { return stringArray(kReplicatorOptionDocIDs); }
        std::string                        filter() const;
        std::map<std::string, std::string> filterParams() const { return stringDict(kReplicatorOptionFilterParams); }
        std::map<std::string, std::string> headers() const { return stringDict(kReplicatorOptionExtraHeaders); }
        std::string                        cookies() const;
        alloc_slice                        pinnedServerCertificate() const;
        std::chrono::seconds               heartbeat() const;
        std::map<std::string, std::string> authentication() const {
            return stringDict(kReplicatorOptionAuthentication);
        }

        //---- Setters; all throw NotWriteable if frozen:

        ReplicatorOptions& setChannels(const std::vector<std::string>&);
        ReplicatorOptions& setDocumentIDs(const std::vector<std::string>&);
        ReplicatorOptions& setFilter(std::string_view name, const std::map<std::string, std::string>& params = {});
        ReplicatorOptions& setHeader(std::string_view name, std::string_view value);
        ReplicatorOptions& addCookie(std::string_view name, std::string_view value);
        ReplicatorOptions& setPinnedServerCertificate(slice certData);
        ReplicatorOptions& setHeartbeat(std::chrono::seconds);
        ReplicatorOptions& setAuthentication(const std::map<std::string, std::string>&);

        //---- Freezing and encoding:

        void freeze() { _frozen = true; }

        bool frozen() const { return _frozen; }

        /// The options as an encoded Fleece dictionary.
        alloc_slice encode() const { return _properties.data(); }

        const fleece::AllocedDict& properties() const { return _properties; }

        explicit operator std::string() const;

      private:
        using ValueWriter = fleece::function_ref<void(fleece::Encoder&)>;

        void mutating() const;
        void rewriteProperty(slice name, const ValueWriter* writer);
        void setProperty(slice name, const ValueWriter& writer);
        void removeProperty(slice name);

        std::vector<std::string>           stringArray(const char* name) const;
        std::map<std::string, std::string> stringDict(const char* name) const;

        fleece::AllocedDict _properties;
        bool                _frozen = false;
    };

#pragma mark - AUTHENTICATORS:

    /** Writes credentials into a ReplicatorOptions before a session is created. */
    class Authenticator {
      public:
        virtual ~Authenticator() = default;
        virtual void authenticate(ReplicatorOptions&) const = 0;
    };

    /** HTTP Basic authentication. */
    class BasicAuthenticator final : public Authenticator {
      public:
        BasicAuthenticator(std::string username, std::string password)
            : _username(std::move(username)), _password(std::move(password)) {}

        const std::string& username() const { return _username; }

        const std::string& password() const { return _password; }

        void authenticate(ReplicatorOptions&) const override;

      private:
        std::string const _username, _password;
    };

    /** Authenticates with an existing Sync Gateway session cookie. */
    class SessionAuthenticator final : public Authenticator {
      public:
        static constexpr const char* kDefaultCookieName = "SyncGatewaySession";

        explicit SessionAuthenticator(std::string sessionID, std::string cookieName = kDefaultCookieName)
            : _sessionID(std::move(sessionID)), _cookieName(std::move(cookieName)) {}

        const std::string& sessionID() const { return _sessionID; }

        const std::string& cookieName() const { return _cookieName; }

        void authenticate(ReplicatorOptions&) const override;

      private:
        std::string const _sessionID, _cookieName;
    };

#pragma mark - CONFIGURATION:

    /** Everything a Replicator needs to know. A Replicator copies its configuration when it's
        created, so later changes to the caller's copy have no effect on it. */
    struct ReplicatorConfiguration {
        Retained<Database>                     database;
        Endpoint                               endpoint;
        ReplicatorType                         replicatorType{ReplicatorType::PushAndPull};
        bool                                   continuous{false};
        std::shared_ptr<const Authenticator>   authenticator;
        std::shared_ptr<ConflictResolver>      conflictResolver;
        ReplicatorOptions                      options;

        ReplicatorConfiguration(Retained<Database> db, Endpoint ep) : database(std::move(db)), endpoint(std::move(ep)) {}

        ReplicatorConfiguration(const ReplicatorConfiguration&)            = default;
        ReplicatorConfiguration& operator=(const ReplicatorConfiguration&) = default;

        /// Throws `InvalidParameter` if the configuration can't be used.
        void validate() const;
    };

}  // namespace synccore
