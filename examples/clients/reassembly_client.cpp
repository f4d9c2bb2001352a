/**
 * Reassembly Client Example
 *
 * Asks a TileStitch server to reassemble a booking's chunked upload and optionally downloads
 * the merged GeoTIFF through the returned presigned URL.
 *
 * Usage:
 *   reassembly_client <server_url> <booking_id> [session_id] [--output file.tif]
 *   reassembly_client <server_url> --sweep
 */

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <Poco/Exception.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/StreamCopier.h>
#include <Poco/URI.h>

using namespace Poco::Net;
using namespace Poco::JSON;
using namespace std;

class ReassemblyClient {
private:
    Poco::URI server_uri;
    HTTPClientSession session;

    string post(const string& path, const string& body, HTTPResponse& response) {
        HTTPRequest request(HTTPRequest::HTTP_POST, path, HTTPMessage::HTTP_1_1);
        request.setContentType("application/json");
        request.setContentLength(static_cast<std::streamsize>(body.length()));

        ostream& request_stream = session.sendRequest(request);
        request_stream << body;

        istream& response_stream = session.receiveResponse(response);
        stringstream response_body;
        Poco::StreamCopier::copyStream(response_stream, response_body);
        return response_body.str();
    }

public:
    explicit ReassemblyClient(const string& url)
        : server_uri(url), session(server_uri.getHost(), server_uri.getPort()) {}

    /**
     * Request reassembly of a booking (and optionally one session). Returns the presigned
     * download URL, or an empty string when the file is not available yet.
     */
    string reassemble(const string& booking_id, const string& session_id) {
        Object::Ptr payload = new Object;
        payload->set("bookingId", booking_id);
        if (!session_id.empty()) {
            payload->set("sessionId", session_id);
        }
        stringstream json_stream;
        payload->stringify(json_stream);

        HTTPResponse response;
        const string body = post("/v1/reassembly", json_stream.str(), response);
        cout << "HTTP " << static_cast<int>(response.getStatus()) << ": " << body << endl;
        if (response.getStatus() != HTTPResponse::HTTP_OK) {
            return "";
        }

        Parser parser;
        Object::Ptr result = parser.parse(body).extract<Object::Ptr>();
        return result->optValue<string>("url", "");
    }

    /**
     * Trigger one sweep of stale pending sessions.
     */
    void sweep() {
        HTTPResponse response;
        const string body = post("/v1/invocations", "{}", response);
        cout << "HTTP " << static_cast<int>(response.getStatus()) << ": " << body << endl;
    }

    /**
     * Download a presigned URL to a local file.
     */
    bool download(const string& url, const string& output_path) {
        Poco::URI uri(url);
        HTTPClientSession download_session(uri.getHost(), uri.getPort());
        HTTPRequest request(HTTPRequest::HTTP_GET, uri.getPathAndQuery(), HTTPMessage::HTTP_1_1);
        download_session.sendRequest(request);

        HTTPResponse response;
        istream& response_stream = download_session.receiveResponse(response);
        if (response.getStatus() != HTTPResponse::HTTP_OK) {
            cout << "Download failed: " << response.getReason() << endl;
            return false;
        }
        ofstream output_file(output_path, ios::binary);
        if (!output_file.is_open()) {
            cout << "Cannot create output file: " << output_path << endl;
            return false;
        }
        Poco::StreamCopier::copyStream(response_stream, output_file);
        cout << "Downloaded " << output_path << endl;
        return true;
    }
};

int main(int argc, char* argv[]) {
    if (argc < 3) {
        cerr << "usage: " << argv[0]
             << " <server_url> <booking_id> [session_id] [--output file.tif]\n"
             << "       " << argv[0] << " <server_url> --sweep" << endl;
        return 2;
    }

    try {
        ReassemblyClient client(argv[1]);
        const string second = argv[2];
        if (second == "--sweep") {
            client.sweep();
            return 0;
        }

        string session_id;
        string output_path;
        for (int i = 3; i < argc; ++i) {
            const string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else {
                session_id = arg;
            }
        }

        const auto url = client.reassemble(second, session_id);
        if (url.empty()) {
            return 1;
        }
        if (!output_path.empty() && !client.download(url, output_path)) {
            return 1;
        }
    } catch (const Poco::Exception& e) {
        cerr << "Request failed: " << e.displayText() << endl;
        return 1;
    } catch (const exception& e) {
        cerr << "Request failed: " << e.what() << endl;
        return 1;
    }
    return 0;
}
