/**
 * @file scaffold.cpp
 * @brief Scaffold templates and descriptor assembly.
 */

#include "provisioning/scaffold.hpp"

#include "core/logger.hpp"

namespace game_factory {

namespace {

constexpr std::string_view LABEL_CREATED_BY = "game_server_factory";

constexpr std::string_view DOCKERFILE_TEMPLATE = R"(FROM node:16-alpine
WORKDIR /usr/src/app
COPY package.json ./
RUN npm install --omit=dev
COPY server.js user_game.js ./
EXPOSE {{CONTAINER_PORT}}
ENV NODE_ENV=production
ENV PORT={{CONTAINER_PORT}}
ENV ROOM_NAME={{ROOM_NAME}}
CMD ["node", "server.js"]
)";

constexpr std::string_view PACKAGE_JSON = R"({
  "name": "game-server",
  "version": "1.0.0",
  "main": "server.js",
  "scripts": {
    "start": "node server.js"
  },
  "dependencies": {
    "express": "^4.18.2",
    "socket.io": "^4.7.2",
    "axios": "^1.6.0"
  }
}
)";

constexpr std::string_view SERVER_TEMPLATE = R"(const express = require('express');
const http = require('http');
const socketIo = require('socket.io');
const axios = require('axios');

const app = express();
const server = http.createServer(app);
const io = socketIo(server, { cors: { origin: '*', methods: ['GET', 'POST'] } });

const PORT = parseInt(process.env.PORT, 10) || {{CONTAINER_PORT}};
const PUBLIC_IP = process.env.PUBLIC_IP || 'localhost';
const PUBLIC_PORT = parseInt(process.env.PUBLIC_PORT, 10) || PORT;
const SERVER_ID = process.env.SERVER_ID || undefined;
const MATCHMAKER_URL = process.env.MATCHMAKER_URL || {{MATCHMAKER_URL}};
const ROOM_NAME = process.env.ROOM_NAME || {{ROOM_NAME}};
const MAX_PLAYERS = parseInt(process.env.MAX_PLAYERS, 10) || {{MAX_PLAYERS}};
const HEARTBEAT_INTERVAL = parseInt(process.env.HEARTBEAT_INTERVAL, 10) || 25000;
const RETRY_INTERVAL = parseInt(process.env.RETRY_INTERVAL, 10) || 5000;

const fallbackGame = {
  initGame: () => ({ clickCount: 0 }),
  handlePlayerAction: (state, action) => {
    if (action === 'click') state.clickCount = (state.clickCount || 0) + 1;
    return state;
  },
};

let game;
try {
  game = require('./user_game.js');
} catch (err) {
  console.error('Failed to load user game:', err);
  game = fallbackGame;
}

let gameState = game.initGame ? game.initGame() : fallbackGame.initGame();
let players = 0;
let registeredId;

app.get('/health', (req, res) => {
  res.json({ status: 'healthy', room: ROOM_NAME, players });
});

io.on('connection', (socket) => {
  players++;
  socket.emit('gameState', gameState);

  socket.on('playerAction', (data) => {
    try {
      const handler = game.handlePlayerAction || fallbackGame.handlePlayerAction;
      gameState = handler(gameState, data.action, data);
      io.emit('gameState', gameState);
    } catch (err) {
      console.error('playerAction failed:', err);
      socket.emit('error', { message: 'action failed' });
    }
  });

  socket.on('disconnect', () => {
    players--;
  });
});

async function register() {
  const res = await axios.post(`${MATCHMAKER_URL}/register`, {
    server_id: SERVER_ID,
    ip: PUBLIC_IP,
    port: PUBLIC_PORT,
    name: ROOM_NAME,
    max_players: MAX_PLAYERS,
    current_players: players,
    metadata: { created_by: 'game_server_factory', game_type: 'custom' },
  });
  registeredId = res.data.server_id;
}

async function heartbeat() {
  try {
    if (!registeredId) {
      await register();
    } else {
      await axios.post(`${MATCHMAKER_URL}/heartbeat/${registeredId}`,
                       { current_players: players });
    }
    setTimeout(heartbeat, HEARTBEAT_INTERVAL);
  } catch (err) {
    // Evicted entries answer 404; register again on the next attempt.
    if (err.response && err.response.status === 404) registeredId = undefined;
    console.error('Heartbeat failed:', err.message);
    setTimeout(heartbeat, RETRY_INTERVAL);
  }
}

server.listen(PORT, () => {
  console.log(`Game server listening on port ${PORT} (${ROOM_NAME})`);
  heartbeat();
});

process.on('SIGTERM', () => {
  server.close(() => process.exit(0));
});
)";

constexpr std::string_view DEFAULT_EXPORT = R"(

module.exports = {
  initGame: typeof initGame !== 'undefined' ? initGame : () => ({ clickCount: 0 }),
  handlePlayerAction: typeof handlePlayerAction !== 'undefined'
    ? handlePlayerAction
    : (gameState, action) => {
        if (action === 'click') gameState.clickCount = (gameState.clickCount || 0) + 1;
        return gameState;
      },
};
)";

std::string js_string(std::string_view text) {
    return "\"" + json_escape(text) + "\"";
}

void replace_all(std::string& text, std::string_view key, std::string_view value) {
    size_t pos = 0;
    while ((pos = text.find(key, pos)) != std::string::npos) {
        text.replace(pos, key.size(), value);
        pos += value.size();
    }
}

}  // anonymous namespace

std::string wrap(std::string_view user_code) {
    std::string out{user_code};
    if (user_code.find("module.exports") != std::string_view::npos) {
        return out;
    }
    out += DEFAULT_EXPORT;
    return out;
}

std::string image_tag_for(std::string_view prefix, const ServerId& server_id) {
    return std::string(prefix) + ":" + server_id;
}

std::string container_name_for(const ServerId& server_id) {
    return "game-server-" + server_id;
}

BuildDescriptor make_build_descriptor(const ServerId& server_id,
                                      std::string_view name,
                                      std::string_view user_code,
                                      const ScaffoldOptions& options) {
    auto port = std::to_string(options.container_port);

    std::string dockerfile{DOCKERFILE_TEMPLATE};
    replace_all(dockerfile, "{{CONTAINER_PORT}}", port);
    replace_all(dockerfile, "{{ROOM_NAME}}", js_string(name));

    std::string server_js{SERVER_TEMPLATE};
    replace_all(server_js, "{{CONTAINER_PORT}}", port);
    replace_all(server_js, "{{MATCHMAKER_URL}}", js_string(options.matchmaker_url));
    replace_all(server_js, "{{ROOM_NAME}}", js_string(name));
    replace_all(server_js, "{{MAX_PLAYERS}}", std::to_string(options.max_players));

    BuildDescriptor descriptor;
    descriptor.image_tag = image_tag_for(options.image_prefix, server_id);
    descriptor.files = {
        {"Dockerfile", std::move(dockerfile)},
        {"package.json", std::string(PACKAGE_JSON)},
        {"server.js", std::move(server_js)},
        {"user_game.js", wrap(user_code)},
    };
    descriptor.labels = {
        {"created_by", std::string(LABEL_CREATED_BY)},
        {"server_id", server_id},
    };
    return descriptor;
}

RunOptions make_run_options(const ServerId& server_id,
                            std::string_view name,
                            const ScaffoldOptions& options) {
    RunOptions run;
    run.container_name = container_name_for(server_id);
    run.network = options.network;
    run.env = {
        {"PORT", std::to_string(options.container_port)},
        {"ROOM_NAME", std::string(name)},
        {"MATCHMAKER_URL", options.matchmaker_url},
        {"MAX_PLAYERS", std::to_string(options.max_players)},
        {"NODE_ENV", "production"},
    };
    run.labels = {
        {"created_by", std::string(LABEL_CREATED_BY)},
        {"server_id", server_id},
        {"server_name", std::string(name)},
    };
    return run;
}

}  // namespace game_factory
