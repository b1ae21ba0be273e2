//
// ReplicatorConfiguration.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "synccore/ReplicatorConfiguration.hh"
#include "synccore/SyncError.hh"
#include "Error.hh"
#include "StringUtil.hh"
#include <cctype>
#include <charconv>

using namespace std;
using namespace fleece;

namespace synccore {

#pragma mark - URL ENDPOINT:

    [[noreturn]] __cold static void invalidURL(string_view url) {
        throw error(error::Network, websocket::kNetErrInvalidURL, format("Invalid URL <%.*s>", int(url.size()), url.data()));
    }

    static string percentDecode(string_view str) {
        string result;
        result.reserve(str.size());
        for ( size_t i = 0; i < str.size(); ++i ) {
            if ( str[i] == '%' && i + 2 < str.size() && isxdigit((unsigned char)str[i + 1])
                 && isxdigit((unsigned char)str[i + 2]) ) {
                result += char(stoi(string(str.substr(i + 1, 2)), nullptr, 16));
                i += 2;
            } else {
                result += str[i];
            }
        }
        return result;
    }

    URLEndpoint::URLEndpoint(string_view url) {
        auto colon = url.find("://");
        if ( colon == string_view::npos || colon == 0 ) invalidURL(url);
        scheme = lowercase(string(url.substr(0, colon)));
        uint16_t defaultPort;
        if ( scheme == "ws" || scheme == "http" ) defaultPort = 80;
        else if ( scheme == "wss" || scheme == "https" )
            defaultPort = 443;
        else
            invalidURL(url);

        string_view rest      = url.substr(colon + 3);
        auto        slash     = rest.find('/');
        string_view authority = rest.substr(0, slash);
        path                  = (slash == string_view::npos) ? "/" : string(rest.substr(slash));

        if ( auto at = authority.rfind('@'); at != string_view::npos ) {
            string_view userInfo = authority.substr(0, at);
            authority            = authority.substr(at + 1);
            auto pwColon         = userInfo.find(':');
            username             = percentDecode(userInfo.substr(0, pwColon));
            if ( pwColon != string_view::npos ) password = percentDecode(userInfo.substr(pwColon + 1));
        }

        string_view portStr;
        if ( hasPrefix(authority, "[") ) {
            // IPv6 literal:
            auto close = authority.find(']');
            if ( close == string_view::npos ) invalidURL(url);
            host = string(authority.substr(1, close - 1));
            authority.remove_prefix(close + 1);
            if ( !authority.empty() ) {
                if ( authority[0] != ':' ) invalidURL(url);
                portStr = authority.substr(1);
            }
        } else {
            auto portColon = authority.find(':');
            host           = string(authority.substr(0, portColon));
            if ( portColon != string_view::npos ) portStr = authority.substr(portColon + 1);
        }
        if ( host.empty() ) invalidURL(url);

        port = defaultPort;
        if ( !portStr.empty() ) {
            unsigned n     = 0;
            auto [end, ec] = from_chars(portStr.data(), portStr.data() + portStr.size(), n);
            if ( ec != errc() || end != portStr.data() + portStr.size() || n == 0 || n > 65535 ) invalidURL(url);
            port = uint16_t(n);
        }
    }

    bool URLEndpoint::isSecure() const { return scheme == "wss" || scheme == "https"; }

    string URLEndpoint::databaseName() const {
        string_view p = path;
        while ( hasSuffix(p, "/") ) p.remove_suffix(1);
        auto slash = p.rfind('/');
        return string(slash == string_view::npos ? p : p.substr(slash + 1));
    }

    string URLEndpoint::url() const {
        string hostStr = (host.find(':') != string::npos) ? "[" + host + "]" : host;
        bool   defaultPort = (port == (isSecure() ? 443 : 80));
        return scheme + "://" + hostStr + (defaultPort ? "" : format(":%u", unsigned(port))) + path;
    }

    string describe(const Endpoint& endpoint) {
        if ( auto url = get_if<URLEndpoint>(&endpoint) ) return url->url();
        auto& db = get<DatabaseEndpoint>(endpoint).database;
        return db ? db->name() : "(null database)";
    }

#pragma mark - OPTIONS:

    ReplicatorOptions::ReplicatorOptions(const ReplicatorOptions& other)
        : _properties(slice(other._properties.data()))  // copy the data, not the reference
    {}

    ReplicatorOptions& ReplicatorOptions::operator=(const ReplicatorOptions& other) {
        if ( this != &other ) {
            _properties = AllocedDict(slice(other._properties.data()));
            _frozen     = false;
        }
        return *this;
    }

    void ReplicatorOptions::mutating() const {
        if ( _frozen ) error::_throw(error::NotWriteable, "Replicator options can't be changed while it's running");
    }

    // Rewrites the properties dictionary with `name` set to the value written by `writer`,
    // or removed if `writer` is null.
    void ReplicatorOptions::rewriteProperty(slice name, const ValueWriter* writer) {
        mutating();
        Encoder enc;
        enc.beginDict();
        if ( writer ) {
            enc.writeKey(name);
            (*writer)(enc);
        }
        for ( Dict::iterator i(_properties); i; ++i ) {
            slice key = i.keyString();
            if ( key != name ) {
                enc.writeKey(key);
                enc.writeValue(i.value());
            }
        }
        enc.endDict();
        _properties = AllocedDict(enc.finish());
    }

    void ReplicatorOptions::setProperty(slice name, const ValueWriter& writer) { rewriteProperty(name, &writer); }

    void ReplicatorOptions::removeProperty(slice name) { rewriteProperty(name, nullptr); }

    vector<string> ReplicatorOptions::stringArray(const char* name) const {
        vector<string> result;
        for ( Array::iterator i(_properties[name].asArray()); i; ++i ) result.emplace_back(i.value().asString());
        return result;
    }

    map<string, string> ReplicatorOptions::stringDict(const char* name) const {
        map<string, string> result;
        for ( Dict::iterator i(_properties[name].asDict()); i; ++i )
            result.emplace(string(i.keyString()), string(i.value().toString()));
        return result;
    }

    string ReplicatorOptions::filter() const { return string(_properties[kReplicatorOptionFilter].asString()); }

    string ReplicatorOptions::cookies() const { return string(_properties[kReplicatorOptionCookies].asString()); }

    alloc_slice ReplicatorOptions::pinnedServerCertificate() const {
        return alloc_slice(_properties[kReplicatorOptionPinnedCert].asData());
    }

    chrono::seconds ReplicatorOptions::heartbeat() const {
        return chrono::seconds(_properties[kReplicatorOptionHeartbeat].asInt());
    }

    static void writeStrings(Encoder& enc, const vector<string>& strings) {
        enc.beginArray();
        for ( auto& str : strings ) enc.writeString(str);
        enc.endArray();
    }

    static void writeStringDict(Encoder& enc, const map<string, string>& dict) {
        enc.beginDict();
        for ( auto& [key, value] : dict ) {
            enc.writeKey(slice(key));
            enc.writeString(value);
        }
        enc.endDict();
    }

    ReplicatorOptions& ReplicatorOptions::setChannels(const vector<string>& channels) {
        if ( channels.empty() ) removeProperty(kReplicatorOptionChannels);
        else
            setProperty(kReplicatorOptionChannels, [&](Encoder& enc) { writeStrings(enc, channels); });
        return *this;
    }

    ReplicatorOptions& ReplicatorOptions::setDocumentIDs(const vector<string>& docIDs) {
        if ( docIDs.empty() ) removeProperty(kReplicatorOptionDocIDs);
        else
            setProperty(kReplicatorOptionDocIDs, [&](Encoder& enc) { writeStrings(enc, docIDs); });
        return *this;
    }

    ReplicatorOptions& ReplicatorOptions::setFilter(string_view name, const map<string, string>& params) {
        if ( name.empty() ) {
            removeProperty(kReplicatorOptionFilter);
            removeProperty(kReplicatorOptionFilterParams);
        } else {
            setProperty(kReplicatorOptionFilter, [&](Encoder& enc) { enc.writeString(slice(name)); });
            if ( params.empty() ) removeProperty(kReplicatorOptionFilterParams);
            else
                setProperty(kReplicatorOptionFilterParams, [&](Encoder& enc) { writeStringDict(enc, params); });
        }
        return *this;
    }

    ReplicatorOptions& ReplicatorOptions::setHeader(string_view name, string_view value) {
        auto headers = this->headers();
        if ( value.empty() ) headers.erase(string(name));
        else
            headers[string(name)] = string(value);
        if ( headers.empty() ) removeProperty(kReplicatorOptionExtraHeaders);
        else
            setProperty(kReplicatorOptionExtraHeaders, [&](Encoder& enc) { writeStringDict(enc, headers); });
        return *this;
    }

    ReplicatorOptions& ReplicatorOptions::addCookie(string_view name, string_view value) {
        string cookies = this->cookies();
        if ( !cookies.empty() ) cookies += "; ";
        cookies += string(name) + "=" + string(value);
        setProperty(kReplicatorOptionCookies, [&](Encoder& enc) { enc.writeString(cookies); });
        return *this;
    }

    ReplicatorOptions& ReplicatorOptions::setPinnedServerCertificate(slice certData) {
        if ( !certData ) removeProperty(kReplicatorOptionPinnedCert);
        else
            setProperty(kReplicatorOptionPinnedCert, [&](Encoder& enc) { enc.writeData(certData); });
        return *this;
    }

    ReplicatorOptions& ReplicatorOptions::setHeartbeat(chrono::seconds heartbeat) {
        if ( heartbeat.count() < 0 ) error::_throw(error::InvalidParameter, "Heartbeat can't be negative");
        if ( heartbeat.count() == 0 ) removeProperty(kReplicatorOptionHeartbeat);
        else
            setProperty(kReplicatorOptionHeartbeat, [&](Encoder& enc) { enc.writeInt(heartbeat.count()); });
        return *this;
    }

    ReplicatorOptions& ReplicatorOptions::setAuthentication(const map<string, string>& auth) {
        if ( auth.empty() ) removeProperty(kReplicatorOptionAuthentication);
        else
            setProperty(kReplicatorOptionAuthentication, [&](Encoder& enc) { writeStringDict(enc, auth); });
        return *this;
    }

    ReplicatorOptions::operator string() const {
        if ( !_properties ) return "{}";
        // Don't reveal credentials in logs:
        auto auth = authentication();
        if ( auth.count(kReplicatorAuthPassword) ) {
            ReplicatorOptions redacted(*this);
            auth[kReplicatorAuthPassword] = "********";
            redacted.setAuthentication(auth);
            return string(redacted._properties.toJSON());
        }
        return string(_properties.toJSON());
    }

#pragma mark - AUTHENTICATORS:

    void BasicAuthenticator::authenticate(ReplicatorOptions& options) const {
        options.setAuthentication({{kReplicatorAuthType, kReplicatorAuthTypeBasic},
                                   {kReplicatorAuthUserName, _username},
                                   {kReplicatorAuthPassword, _password}});
    }

    void SessionAuthenticator::authenticate(ReplicatorOptions& options) const {
        options.addCookie(_cookieName, _sessionID);
    }

#pragma mark - CONFIGURATION:

    void ReplicatorConfiguration::validate() const {
        if ( !database ) error::_throw(error::InvalidParameter, "Replicator configuration has no database");
        if ( auto dbEndpoint = get_if<DatabaseEndpoint>(&endpoint) ) {
            if ( !dbEndpoint->database )
                error::_throw(error::InvalidParameter, "Replicator target database is missing");
            if ( dbEndpoint->database == database )
                error::_throw(error::InvalidParameter, "Can't replicate a database with itself");
        }
        auto type = int(replicatorType);
        if ( type < int(ReplicatorType::PushAndPull) || type > int(ReplicatorType::Pull) )
            error::_throw(error::InvalidParameter, "Replicator must push, pull, or both");
    }

}  // namespace synccore
